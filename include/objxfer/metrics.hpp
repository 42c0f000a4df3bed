#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace objxfer {

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram* histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        if (!histogram_) return;
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_->Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram* histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Per-invocation transfer counters, written to a Prometheus textfile when
/// the command finishes.
///
/// op is the command ("rm", "cp"); result is "success", "failure" or
/// "skipped". Safe to call from the listing and removal tasks concurrently.
class TransferMetrics {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param labels          Constant labels applied to all metrics.
    TransferMetrics(const std::filesystem::path& prom_file_path,
                    const std::map<std::string, std::string>& labels = {});

    TransferMetrics(const TransferMetrics&) = delete;
    TransferMetrics& operator=(const TransferMetrics&) = delete;

    void record_object(const std::string& op, const std::string& result, double count = 1);
    void record_bytes(const std::string& op, uint64_t bytes);

    /// Histogram for timing one object of op (use with ScopedTimer).
    prometheus::Histogram* duration(const std::string& op);

    double objects(const std::string& op, const std::string& result);
    double bytes(const std::string& op);

    /// Serialize the registry to the textfile via temp+rename.
    bool write_file();

    const std::filesystem::path& path() const { return prom_file_path_; }

private:
    std::filesystem::path prom_file_path_;
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* objects_family_;
    prometheus::Family<prometheus::Counter>* bytes_family_;
    prometheus::Family<prometheus::Histogram>* duration_family_;
};

}  // namespace objxfer
