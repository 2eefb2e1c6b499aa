// File: common/formatting/fmt_metrics.hpp

#ifndef FMT_METRICS_HPP
#define FMT_METRICS_HPP

#include <fmt/core.h>
#include <fmt/format.h>

#include "evaluation/metrics.hpp"

template<>
struct fmt::formatter<evaluation::Metrics> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const evaluation::Metrics &metrics, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "accuracy={:.4f}, precision={:.4f}, recall={:.4f}, f1={:.4f}",
                              metrics.accuracy, metrics.precision, metrics.recall, metrics.f1);
    }
};

template<>
struct fmt::formatter<evaluation::LabelMetrics> {
    constexpr auto parse(format_parse_context &ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const evaluation::LabelMetrics &metrics, FormatContext &ctx) const {
        return fmt::format_to(ctx.out(), "{}: precision={:.4f}, recall={:.4f}, f1={:.4f}, support={}", metrics.label,
                              metrics.precision, metrics.recall, metrics.f1, metrics.support);
    }
};

#endif // FMT_METRICS_HPP
