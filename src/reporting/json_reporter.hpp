#pragma once

#include "reporter.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace querylens::reporting {

// JSON reporter for structured output: one document written at report_end()
class JsonReporter : public Reporter {
public:
    explicit JsonReporter(const std::string& output_file = "", std::ostream& out = std::cout)
        : output_file_(output_file), out_(out) {}
    
    void report_start(config::ResolveMode mode) override;
    void report_query(const resolver::ResolvedQuery& query) override;
    void report_failure(const sources::QuerySource& source,
                        const std::string& message) override;
    void report_summary(size_t total, size_t ok, size_t failed,
                        std::chrono::microseconds total_duration) override;
    void report_end() override;
    
    const nlohmann::json& document() const { return root_; }
    
private:
    std::string output_file_;
    std::ostream& out_;
    nlohmann::json root_;
    nlohmann::json queries_ = nlohmann::json::array();
    nlohmann::json failures_ = nlohmann::json::array();
};

} // namespace querylens::reporting
