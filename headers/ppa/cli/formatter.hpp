//
// Created by gregorian-rayne on 10/17/26.
//

#ifndef PPA_FORMATTER_HPP
#define PPA_FORMATTER_HPP

/**
 * @file formatter.hpp
 * @brief Output formatting utilities for CLI.
 *
 * Provides consistent formatting for:
 * - Tables
 * - Colors and styles
 * - Issue lists, summaries and the structural model
 */

#include "ppa/analysis/ast_analyzer.hpp"
#include "ppa/types.hpp"

#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace ppa::cli
{
    /**
     * Terminal color codes.
     */
    namespace colors {

        extern const char* RESET;
        extern const char* BOLD;
        extern const char* DIM;

        extern const char* RED;
        extern const char* YELLOW;
        extern const char* CYAN;

        /**
         * Returns true if colors should be used.
         */
        bool enabled();

        /**
         * Enable/disable colors globally.
         */
        void set_enabled(bool enable);

        /**
         * Wraps text in an escape code when colors are enabled.
         */
        [[nodiscard]] std::string paint(const char* code, std::string_view text);

    }  // namespace colors

    /**
     * True when stdout is a terminal.
     */
    bool is_tty();

    /**
     * Table column definition.
     */
    struct Column {
        std::string header;
        std::size_t width = 0;    // 0 = auto
        bool right_align = false;
    };

    using Row = std::vector<std::string>;

    /**
     * Table formatter for aligned output.
     */
    class Table {
    public:
        explicit Table(std::vector<Column> columns);

        void add_row(Row row);
        void add_separator();

        [[nodiscard]] std::string render() const;
        void render(std::ostream& out) const;

        [[nodiscard]] std::size_t row_count() const noexcept { return rows_.size(); }

        void set_show_headers(bool show) { show_headers_ = show; }

    private:
        void calculate_widths();

        std::vector<Column> columns_;
        std::vector<Row> rows_;
        std::vector<bool> separators_;
        bool show_headers_ = true;
    };

    /**
     * Formats a file path for display (truncates if too long).
     */
    [[nodiscard]] std::string format_path(const std::filesystem::path& path, std::size_t max_width = 60);

    /**
     * Colorizes a severity label ("CRITICAL", "HIGH", ...).
     */
    [[nodiscard]] std::string colorize_severity(Severity severity);

    /**
     * Issue printer for check results.
     */
    class IssuePrinter {
    public:
        explicit IssuePrinter(std::ostream& out);

        /**
         * Prints one block per issue: location, description, suggestion
         * and the snippet when present.
         */
        void print_issues(const std::vector<PerformanceIssue>& issues,
                          const std::optional<std::string>& file = std::nullopt) const;

        /**
         * Prints counts per severity and per non-empty category.
         */
        void print_summary(const IssueSummary& summary) const;

        /**
         * Prints the structural model as tables.
         */
        void print_structure(const analysis::AstAnalyzer& analyzer) const;

    private:
        std::ostream& out_;
    };

}  // namespace ppa::cli

#endif //PPA_FORMATTER_HPP
