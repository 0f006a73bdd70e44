#include "s3backup/metrics.hpp"
#include "s3backup/core/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace s3backup {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& files_family = prometheus::BuildCounter()
        .Name("s3backup_files_total")
        .Help("Files processed in the last run by result")
        .Labels(labels)
        .Register(*registry_);
    files_uploaded_ = &files_family.Add({{"result", "uploaded"}});
    files_skipped_ = &files_family.Add({{"result", "skipped"}});
    files_failed_ = &files_family.Add({{"result", "failed"}});

    deleted_total_ = &prometheus::BuildCounter()
        .Name("s3backup_deleted_total")
        .Help("Local files removed after verified upload")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("s3backup_upload_bytes_total")
        .Help("Total bytes uploaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    candidates_ = &gauge_reg("s3backup_candidates", "Candidate files selected in the last run");
    last_run_success_ = &gauge_reg("s3backup_last_run_success", "1 if the last run had no failures");
    last_run_timestamp_ = &gauge_reg("s3backup_last_run_timestamp_seconds",
                                     "Unix time the last run finished");

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("s3backup_upload_duration_seconds")
        .Help("Per-file upload and verification duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600, 1800, 3600});

    run_duration_ = &prometheus::BuildHistogram()
        .Name("s3backup_run_duration_seconds")
        .Help("Whole run duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            1, 10, 60, 300, 900, 1800, 3600, 7200, 14400});
}

std::string MetricsExporter::serialize() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

bool MetricsExporter::write_file() const {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_error("Cannot write metrics file %s", tmp_path.c_str());
        return false;
    }
    ofs << serialize();
    ofs.close();
    if (!ofs.good()) {
        log_error("Cannot write metrics file %s", tmp_path.c_str());
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    if (ec) {
        log_error("Cannot rename metrics file into %s: %s",
                  prom_file_path_.c_str(), ec.message().c_str());
        return false;
    }
    return true;
}

}  // namespace s3backup
