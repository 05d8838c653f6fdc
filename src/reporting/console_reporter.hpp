#pragma once

#include "reporter.hpp"
#include <iostream>
#include <vector>

namespace querylens::reporting {

// Console reporter with formatted output
class ConsoleReporter : public Reporter {
public:
    explicit ConsoleReporter(std::ostream& out = std::cout, bool verbose = false)
        : out_(out), verbose_(verbose) {}
    
    void report_start(config::ResolveMode mode) override;
    void report_query(const resolver::ResolvedQuery& query) override;
    void report_failure(const sources::QuerySource& source,
                        const std::string& message) override;
    void report_summary(size_t total, size_t ok, size_t failed,
                        std::chrono::microseconds total_duration) override;
    void report_end() override;
    
private:
    struct Failure {
        std::string name;
        std::string location;
        std::string message;
    };
    
    std::ostream& out_;
    bool verbose_;
    std::vector<Failure> failures_;
};

} // namespace querylens::reporting
