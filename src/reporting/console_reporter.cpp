#include "console_reporter.hpp"
#include "querylens/version.hpp"
#include <iomanip>
#include <sstream>

namespace querylens::reporting {

std::string nullability_label(const describe::Nullability& nullable) {
    if (!nullable) {
        return "NULL?";
    }
    return *nullable ? "NULL" : "NOT NULL";
}

std::string format_duration(std::chrono::microseconds duration) {
    auto us = duration.count();
    
    if (us < 1000) {
        return std::to_string(us) + " us";
    } else if (us < 1000000) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << (us / 1000.0) << " ms";
        return oss.str();
    } else {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << (us / 1000000.0) << " s";
        return oss.str();
    }
}

void ConsoleReporter::report_start(config::ResolveMode mode) {
    out_ << "querylens v" << QUERYLENS_VERSION << " - resolving queries "
         << config::resolve_mode_to_string(mode) << "\n\n";
}

void ConsoleReporter::report_query(const resolver::ResolvedQuery& query) {
    out_ << "[ OK ] " << query.source.name << "  (" << query.source.location() << ")\n";
    
    if (verbose_) {
        out_ << "  Database:   " << query.data.db_name << "\n";
        out_ << "  Hash:       " << query.data.hash << "\n";
    }
    
    if (!query.parameters.empty()) {
        out_ << "  Parameters:";
        if (!query.data.describe.parameter_types_known) {
            out_ << "  (types not reported by the driver)";
        }
        out_ << "\n";
        for (const auto& param : query.parameters) {
            out_ << "    " << std::right << std::setw(3) << param.ordinal << "  "
                 << std::left << std::setw(24) << param.field_name << " "
                 << std::setw(18) << describe::display_type_name(param.sql_type) << " "
                 << std::setw(28) << param.host_type << " "
                 << (param.nullable ? "NULL" : "NOT NULL") << "\n";
        }
    }
    
    if (query.columns.empty()) {
        out_ << "  (no result columns)\n";
    } else {
        out_ << "  Columns:\n";
        for (const auto& column : query.columns) {
            out_ << "    " << std::right << std::setw(3) << column.ordinal << "  "
                 << std::left << std::setw(24) << column.field_name << " "
                 << std::setw(18) << describe::display_type_name(column.sql_type) << " "
                 << std::setw(28) << column.host_type << " ";
            
            if (column.nullable_overridden) {
                out_ << (column.nullable ? "NULL" : "NOT NULL") << " (override)";
            } else {
                out_ << nullability_label(column.described_nullable);
            }
            if (column.type_overridden) {
                out_ << " [type override]";
            }
            out_ << "\n";
        }
    }
    out_ << std::right << "\n";
}

void ConsoleReporter::report_failure(const sources::QuerySource& source,
                                     const std::string& message) {
    out_ << "[FAIL] " << source.name << "  (" << source.location() << ")\n";
    out_ << "       " << message << "\n\n";
    failures_.push_back({source.name, source.location(), message});
}

void ConsoleReporter::report_summary(size_t total, size_t ok, size_t failed,
                                     std::chrono::microseconds total_duration) {
    out_ << "SUMMARY:\n";
    out_ << "  Total Queries: " << total << "\n";
    out_ << "  Resolved:      " << ok << "\n";
    if (failed > 0) {
        out_ << "  Failed:        " << failed << "\n";
    }
    out_ << "  Total Time:    " << format_duration(total_duration) << "\n\n";
    
    if (!failures_.empty()) {
        out_ << "FAILURES:\n";
        for (const auto& f : failures_) {
            out_ << "  " << f.name << " (" << f.location << ")\n";
            out_ << "    " << f.message << "\n";
        }
        out_ << "\n";
    }
    
    if (failed == 0) {
        out_ << "  [PASS] ALL QUERIES RESOLVED\n";
    } else {
        out_ << "  [FAIL] SOME QUERIES FAILED\n";
    }
    out_ << "\n";
}

void ConsoleReporter::report_end() {
    out_ << std::flush;
}

} // namespace querylens::reporting
