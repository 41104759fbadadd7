//
// Created by gregorian-rayne on 10/17/26.
//

#include "ppa/cli/formatter.hpp"
#include "ppa/utils/string_utils.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

#ifdef _WIN32
#include <io.h>
#include <cstdio>
#else
#include <unistd.h>
#include <cstdio>
#endif

namespace ppa::cli
{
    // ============================================================================
    // Colors
    // ============================================================================

    namespace colors {

        static bool g_colors_enabled = true;

        const char* RESET = "\033[0m";
        const char* BOLD = "\033[1m";
        const char* DIM = "\033[2m";

        const char* RED = "\033[31m";
        const char* YELLOW = "\033[33m";
        const char* CYAN = "\033[36m";

        bool enabled() {
            return g_colors_enabled && is_tty();
        }

        void set_enabled(const bool enable) {
            g_colors_enabled = enable;
        }

        std::string paint(const char* code, const std::string_view text) {
            if (!enabled()) {
                return std::string(text);
            }
            return std::string(code) + std::string(text) + RESET;
        }

    }  // namespace colors

    bool is_tty() {
#ifdef _WIN32
        return _isatty(_fileno(stdout)) != 0;
#else
        return isatty(fileno(stdout)) != 0;
#endif
    }

    // ============================================================================
    // Formatting Functions
    // ============================================================================

    std::string format_path(const std::filesystem::path& path, const std::size_t max_width) {
        std::string str = path.string();
        if (str.length() <= max_width) {
            return str;
        }

        // Truncate from the beginning
        const std::string ellipsis = "...";
        return ellipsis + str.substr(str.length() - max_width + ellipsis.length());
    }

    std::string colorize_severity(const Severity severity) {
        const std::string label = string_utils::to_upper(to_string(severity));
        switch (severity) {
            case Severity::Critical:
                return colors::paint("\033[1;31m", label);
            case Severity::High:
                return colors::paint(colors::YELLOW, label);
            case Severity::Medium:
                return colors::paint(colors::CYAN, label);
            case Severity::Low:
                return colors::paint(colors::DIM, label);
        }
        return label;
    }

    // ============================================================================
    // Table Implementation
    // ============================================================================

    Table::Table(std::vector<Column> columns)
        : columns_(std::move(columns))
    {}

    void Table::add_row(Row row) {
        while (row.size() < columns_.size()) {
            row.emplace_back();
        }
        rows_.push_back(std::move(row));
        separators_.push_back(false);
    }

    void Table::add_separator() {
        if (!separators_.empty()) {
            separators_.back() = true;
        }
    }

    void Table::calculate_widths() {
        for (std::size_t i = 0; i < columns_.size(); ++i) {
            if (columns_[i].width != 0) {
                continue;
            }
            std::size_t max_width = columns_[i].header.length();
            for (const auto& row : rows_) {
                if (i < row.size()) {
                    max_width = std::max(max_width, row[i].length());
                }
            }
            columns_[i].width = max_width;
        }
    }

    std::string Table::render() const {
        std::ostringstream ss;
        render(ss);
        return ss.str();
    }

    void Table::render(std::ostream& out) const {
        Table temp = *this;
        temp.calculate_widths();

        auto render_row = [&](const Row& row, const bool is_header) {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                const auto& col = temp.columns_[i];
                std::string cell = i < row.size() ? row[i] : "";

                if (cell.length() > col.width && col.width > 3) {
                    cell = cell.substr(0, col.width - 3) + "...";
                }

                if (is_header && colors::enabled()) {
                    out << colors::BOLD;
                }

                if (col.right_align) {
                    out << std::right << std::setw(static_cast<int>(col.width)) << cell;
                } else {
                    out << std::left << std::setw(static_cast<int>(col.width)) << cell;
                }

                if (is_header && colors::enabled()) {
                    out << colors::RESET;
                }

                if (i < temp.columns_.size() - 1) {
                    out << "  ";
                }
            }
            out << "\n";
        };

        auto render_separator = [&]() {
            for (std::size_t i = 0; i < temp.columns_.size(); ++i) {
                out << std::string(temp.columns_[i].width, '-');
                if (i < temp.columns_.size() - 1) {
                    out << "--";
                }
            }
            out << "\n";
        };

        if (show_headers_) {
            Row header;
            for (const auto& col : temp.columns_) {
                header.push_back(col.header);
            }
            render_row(header, true);
            render_separator();
        }

        for (std::size_t i = 0; i < temp.rows_.size(); ++i) {
            render_row(temp.rows_[i], false);
            if (temp.separators_[i]) {
                render_separator();
            }
        }
    }

    // ============================================================================
    // IssuePrinter Implementation
    // ============================================================================

    namespace {

        void print_heading(std::ostream& out, const std::string_view title) {
            out << "\n";
            if (colors::enabled()) {
                out << colors::BOLD << title << colors::RESET << "\n";
            } else {
                out << title << "\n";
            }
            out << std::string(60, '=') << "\n";
        }

        std::string yes_no(const bool value) {
            return value ? "yes" : "";
        }

    }  // namespace

    IssuePrinter::IssuePrinter(std::ostream& out)
        : out_(out)
    {}

    void IssuePrinter::print_issues(const std::vector<PerformanceIssue>& issues,
                                    const std::optional<std::string>& file) const {
        if (issues.empty()) {
            out_ << (file ? *file + ": " : std::string()) << "no performance issues found\n";
            return;
        }

        for (const auto& issue : issues) {
            out_ << (file ? *file + ":" : std::string("line ")) << issue.line;
            if (issue.end_line != issue.line) {
                out_ << "-" << issue.end_line;
            }
            out_ << ": " << colorize_severity(issue.severity) << " [" << to_string(issue.category) << "]";
            if (issue.function_name) {
                out_ << " in " << *issue.function_name << "()";
            }
            out_ << "\n";
            out_ << "  " << issue.description << "\n";
            out_ << "  suggestion: " << issue.suggestion << "\n";
            if (issue.code_snippet && !issue.code_snippet->empty()) {
                for (const auto line : string_utils::split_lines(*issue.code_snippet)) {
                    out_ << "    | " << line << "\n";
                }
            }
            out_ << "\n";
        }
    }

    void IssuePrinter::print_summary(const IssueSummary& summary) const {
        print_heading(out_, "Summary");
        out_ << "Total issues: " << summary.total_issues << "\n\n";

        Table severities({{"Severity"}, {"Count", 0, true}});
        for (const auto severity : kAllSeverities) {
            const auto it = summary.by_severity.find(severity);
            severities.add_row({to_string(severity), std::to_string(it != summary.by_severity.end() ? it->second : 0)});
        }
        severities.render(out_);

        Table categories({{"Category"}, {"Count", 0, true}});
        for (const auto& [category, count] : summary.by_category) {
            if (count > 0) {
                categories.add_row({to_string(category), std::to_string(count)});
            }
        }
        if (categories.row_count() > 0) {
            out_ << "\n";
            categories.render(out_);
        }
    }

    void IssuePrinter::print_structure(const analysis::AstAnalyzer& analyzer) const {
        print_heading(out_, "Functions");
        Table functions({{"Line", 0, true}, {"Name"}, {"Async"}, {"Parameters"}, {"Decorators"}});
        for (const auto& f : analyzer.functions()) {
            functions.add_row({std::to_string(f.line), f.name, yes_no(f.is_async),
                               string_utils::join(f.parameters, ", "), string_utils::join(f.decorators, ", ")});
        }
        functions.render(out_);

        print_heading(out_, "Classes");
        Table classes({{"Line", 0, true}, {"Name"}, {"Bases"}, {"Methods"}});
        for (const auto& c : analyzer.classes()) {
            classes.add_row({std::to_string(c.line), c.name, string_utils::join(c.bases, ", "),
                             string_utils::join(c.methods, ", ")});
        }
        classes.render(out_);

        print_heading(out_, "Loops");
        Table loops({{"Line", 0, true}, {"Kind"}, {"Level", 0, true}, {"Function"}, {"Async ctx"}});
        for (const auto& l : analyzer.loops()) {
            std::string kind = analysis::to_string(l.kind);
            if (l.is_comprehension) {
                kind += " (comprehension)";
            } else if (l.is_async) {
                kind = "async " + kind;
            }
            loops.add_row({std::to_string(l.line), kind, std::to_string(l.nesting_level),
                           l.parent_function.value_or(""), yes_no(l.is_in_async_function)});
        }
        loops.render(out_);

        print_heading(out_, "Imports");
        Table imports({{"Line", 0, true}, {"Module"}, {"Names"}, {"Resolved"}});
        for (const auto& i : analyzer.imports()) {
            imports.add_row({std::to_string(i.line), i.module, string_utils::join(i.names, ", "),
                             i.resolved_module.value_or("")});
        }
        imports.render(out_);

        print_heading(out_, "Calls");
        Table calls({{"Line", 0, true}, {"Call"}, {"Resolved"}, {"Function"}, {"Loop"}, {"Async"}});
        for (const auto& c : analyzer.calls()) {
            calls.add_row({std::to_string(c.line), c.function_name, c.resolved_name.value_or(""),
                           c.parent_function.value_or(""), yes_no(c.is_in_loop), yes_no(c.is_in_async_function)});
        }
        calls.render(out_);

        out_ << "\nMax loop nesting depth: " << analyzer.max_loop_nesting_depth() << "\n";
    }

}  // namespace ppa::cli
