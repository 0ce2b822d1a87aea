#include "metrics.hpp"

Metrics& Metrics::get()
{
    static auto& reg = cpprom::Registry::getDefault();
    static auto durationBuckets = cpprom::Histogram::defaultBuckets();
    static Metrics metrics {
        reg.counter("shiftpay_shifts_appended_total", {}, "Number of shift records appended"),
        reg.counter("shiftpay_appends_rejected_total", { "reason" },
            "Number of shift records that were not appended"),
        reg.counter("shiftpay_bonus_updates_total", { "value" },
            "Number of shift records whose bonus flag was rewritten"),
        reg.counter("shiftpay_malformed_lines_total", { "file" },
            "Number of lines skipped because they could not be parsed"),
        reg.counter("shiftpay_file_writes_total", { "path" }, "Number of whole-file rewrites"),
        reg.histogram(
            "shiftpay_file_read_duration", { "path" }, durationBuckets, "Time to read a file"),
    };
    return metrics;
}
