// File: reporting/report_generator.cpp

#include "reporting/report_generator.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include "common/io/io.hpp"
#include "common/logging/logger.hpp"

namespace reporting {

    namespace {
        using json = nlohmann::json;

        // Path of target as seen from the directory base, falling back to target when no relative form exists.
        std::string relativeReference(const std::filesystem::path &target, const std::filesystem::path &base) {
            const auto absolute_target = std::filesystem::absolute(target).lexically_normal();
            const auto absolute_base = std::filesystem::absolute(base).lexically_normal();
            const auto relative = absolute_target.lexically_relative(absolute_base);
            return relative.empty() ? target.generic_string() : relative.generic_string();
        }

        // RFC 4180: fields holding a separator, quote or line break are quoted, inner quotes doubled.
        std::string csvField(const std::string &field) {
            if (field.find_first_of(",\"\r\n") == std::string::npos) {
                return field;
            }
            std::string quoted = "\"";
            for (const char c: field) {
                if (c == '"') {
                    quoted += '"';
                }
                quoted += c;
            }
            quoted += '"';
            return quoted;
        }

        constexpr std::string_view html_head_ = R"(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <title>{title}</title>
    <style>
        body {{ font-family: Arial, sans-serif; padding: 20px; }}
        h1 {{ color: #333; }}
        table {{ border-collapse: collapse; margin-top: 20px; }}
        th, td {{ border: 1px solid #ccc; padding: 8px; text-align: center; }}
        figure {{ display: inline-block; margin: 10px; }}
        img {{ height: 200px; }}
    </style>
</head>
<body>
    <h1>{title}</h1>
)";
    } // namespace

    ReportGenerator::ReportGenerator() : ReportGenerator(Options{}) {}

    ReportGenerator::ReportGenerator(Options options) : options_(std::move(options)) {}

    std::string ReportGenerator::escape(const std::string_view text) {
        std::string escaped;
        escaped.reserve(text.size());
        for (const char c: text) {
            switch (c) {
                case '&':
                    escaped += "&amp;";
                    break;
                case '<':
                    escaped += "&lt;";
                    break;
                case '>':
                    escaped += "&gt;";
                    break;
                case '"':
                    escaped += "&quot;";
                    break;
                case '\'':
                    escaped += "&#39;";
                    break;
                default:
                    escaped += c;
            }
        }
        return escaped;
    }

    std::string ReportGenerator::renderCsv(const evaluation::ConfusionMatrix &matrix) {
        std::vector<std::string> labels(matrix.labels().size());
        std::ranges::transform(matrix.labels(), labels.begin(), csvField);

        std::string csv = fmt::format("GroundTruth/Predicted,{}\n", fmt::join(labels, ","));
        for (std::size_t row = 0; row < labels.size(); ++row) {
            const auto counts = matrix.counts().row(static_cast<Eigen::Index>(row));
            csv += labels[row];
            for (Eigen::Index col = 0; col < counts.size(); ++col) {
                fmt::format_to(std::back_inserter(csv), ",{}", counts(col));
            }
            csv += '\n';
        }
        return csv;
    }

    std::vector<std::filesystem::path> ReportGenerator::galleryImages(const std::filesystem::path &folder) {
        if (!common::io::directoryExists(folder)) {
            return {};
        }

        std::vector<std::filesystem::path> images;
        try {
            for (auto &file: common::io::listFiles(folder)) {
                if (common::io::isImageFile(file)) {
                    images.push_back(std::move(file));
                }
            }
        } catch (const std::runtime_error &e) {
            LOG_WARN("Gallery folder {} could not be listed: {}", folder.string(), e.what());
            return {};
        }
        return images;
    }

    std::string ReportGenerator::renderHtml(const evaluation::Evaluation &evaluation, const RunSummary &summary,
                                            const ReportArtifacts &artifacts) const {
        const auto html_directory = artifacts.html.parent_path();
        const auto &metrics = evaluation.metrics;

        std::string html = fmt::format(fmt::runtime(html_head_), fmt::arg("title", escape(options_.title)));
        auto out = std::back_inserter(html);

        fmt::format_to(out,
                       "    <h2>Metrics</h2>\n"
                       "    <ul>\n"
                       "        <li><b>Accuracy:</b> {:.4f}</li>\n"
                       "        <li><b>Precision:</b> {:.4f}</li>\n"
                       "        <li><b>Recall:</b> {:.4f}</li>\n"
                       "        <li><b>F1 Score:</b> {:.4f}</li>\n"
                       "    </ul>\n"
                       "    <p>Evaluated samples: {} (skipped: {})</p>\n",
                       metrics.accuracy, metrics.precision, metrics.recall, metrics.f1, summary.evaluated,
                       summary.skipped);

        if (options_.include_per_label && !evaluation.per_label.empty()) {
            html += "    <h2>Per-Label Metrics</h2>\n"
                    "    <table>\n"
                    "        <tr><th>Label</th><th>Precision</th><th>Recall</th><th>F1 Score</th><th>Support</th></tr>\n";
            for (const auto &label: evaluation.per_label) {
                fmt::format_to(out,
                               "        <tr><td>{}</td><td>{:.4f}</td><td>{:.4f}</td><td>{:.4f}</td><td>{}</td></tr>\n",
                               escape(label.label), label.precision, label.recall, label.f1, label.support);
            }
            html += "    </table>\n";
        }

        fmt::format_to(out,
                       "    <h2>Confusion Matrix</h2>\n"
                       "    <p><a href=\"{}\">Download CSV</a></p>\n",
                       escape(relativeReference(artifacts.csv, html_directory)));

        if (options_.include_gallery) {
            html += "    <h2>Sample Predictions</h2>\n";
            if (artifacts.sample_folder) {
                for (const auto &image: galleryImages(*artifacts.sample_folder)) {
                    const auto name = image.filename().string();
                    fmt::format_to(out,
                                   "    <figure><img src=\"{}\" alt=\"Sample\"><figcaption>{}</figcaption></figure>\n",
                                   escape(relativeReference(image, html_directory)), escape(name));
                }
            }
        }

        html += "</body>\n</html>\n";
        return html;
    }

    std::string ReportGenerator::renderJson(const evaluation::Evaluation &evaluation, const RunSummary &summary) {
        json per_label = json::array();
        for (const auto &label: evaluation.per_label) {
            per_label.push_back({{"label", label.label},
                                 {"precision", label.precision},
                                 {"recall", label.recall},
                                 {"f1", label.f1},
                                 {"support", label.support},
                                 {"predicted", label.predicted}});
        }

        const json document = {{"metrics",
                                {{"accuracy", evaluation.metrics.accuracy},
                                 {"precision", evaluation.metrics.precision},
                                 {"recall", evaluation.metrics.recall},
                                 {"f1", evaluation.metrics.f1}}},
                               {"samples", {{"evaluated", summary.evaluated}, {"skipped", summary.skipped}}},
                               {"labels", evaluation.matrix.labels()},
                               {"per_label", per_label}};
        return document.dump(4) + "\n";
    }

    void ReportGenerator::write(const std::filesystem::path &path, const std::string &content,
                                ReportOutcome &outcome) {
        try {
            if (path.has_parent_path()) {
                common::io::createDirectory(path.parent_path());
            }
            common::io::writeStringToFile(path, content);
            outcome.written.push_back(path);
            outcome.events.info(stage_, "Wrote {}", path.string());
        } catch (const std::runtime_error &e) {
            ReportWriteError error(path, e.what());
            outcome.events.error(stage_, "{}", error.what());
            outcome.failures.push_back(std::move(error));
        }
    }

    ReportOutcome ReportGenerator::generate(const evaluation::Evaluation &evaluation, const RunSummary &summary,
                                            const ReportArtifacts &artifacts) const {
        ReportOutcome outcome;
        write(artifacts.csv, renderCsv(evaluation.matrix), outcome);
        write(artifacts.html, renderHtml(evaluation, summary, artifacts), outcome);
        if (artifacts.json) {
            write(*artifacts.json, renderJson(evaluation, summary), outcome);
        }
        return outcome;
    }

} // namespace reporting
