#include "objxfer/metrics.hpp"
#include "objxfer/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace objxfer {

TransferMetrics::TransferMetrics(const std::filesystem::path& prom_file_path,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , registry_(std::make_shared<prometheus::Registry>()) {

    objects_family_ = &prometheus::BuildCounter()
        .Name("objxfer_objects_total")
        .Help("Objects processed by operation and result")
        .Labels(labels)
        .Register(*registry_);

    bytes_family_ = &prometheus::BuildCounter()
        .Name("objxfer_bytes_total")
        .Help("Bytes transferred or removed by operation")
        .Labels(labels)
        .Register(*registry_);

    duration_family_ = &prometheus::BuildHistogram()
        .Name("objxfer_object_duration_seconds")
        .Help("Per-object operation duration in seconds")
        .Labels(labels)
        .Register(*registry_);
}

void TransferMetrics::record_object(const std::string& op, const std::string& result,
                                    double count) {
    objects_family_->Add({{"op", op}, {"result", result}}).Increment(count);
}

void TransferMetrics::record_bytes(const std::string& op, uint64_t bytes) {
    bytes_family_->Add({{"op", op}}).Increment(static_cast<double>(bytes));
}

prometheus::Histogram* TransferMetrics::duration(const std::string& op) {
    return &duration_family_->Add({{"op", op}}, prometheus::Histogram::BucketBoundaries{
        0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300});
}

double TransferMetrics::objects(const std::string& op, const std::string& result) {
    return objects_family_->Add({{"op", op}, {"result", result}}).Value();
}

double TransferMetrics::bytes(const std::string& op) {
    return bytes_family_->Add({{"op", op}}).Value();
}

bool TransferMetrics::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) {
        log_warn("Failed writing metrics file %s", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_warn("Cannot rename %s to %s: %s", tmp_path.c_str(), prom_file_path_.c_str(),
                 ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace objxfer
