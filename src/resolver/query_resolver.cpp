#include "query_resolver.hpp"
#include "core/crash_guard.hpp"
#include "core/logger.hpp"
#include "core/resolve_error.hpp"
#include "utils/identifiers.hpp"
#include <map>

namespace querylens::resolver {

QueryResolver::QueryResolver(config::ResolverConfig config)
    : config_(std::move(config))
    , mode_(config_.effective_mode())
    , cache_(config_.offline_dir) {
    LOG_INFO(std::string("Resolving queries ") + config::resolve_mode_to_string(mode_));
}

QueryResolver::~QueryResolver() = default;

void QueryResolver::connect() {
    if (conn_ && conn_->is_connected()) {
        return;
    }
    
    LOG_DEBUG("Opening database connection");
    env_ = std::make_unique<core::OdbcEnvironment>();
    conn_ = std::make_unique<core::OdbcConnection>(*env_);
    conn_->connect(config_.connection_string);
    
    db_name_ = conn_->dbms_name();
    describer_ = std::make_unique<describe::QueryDescriber>(*conn_);
    LOG_INFO("Connected to " + db_name_);
}

cache::QueryData QueryResolver::fetch(const sources::QuerySource& source) {
    if (mode_ == config::ResolveMode::Offline) {
        return load_offline(source);
    }
    return describe_online(source);
}

ResolvedQuery QueryResolver::resolve(const sources::QuerySource& source) {
    LOG_DEBUG("Resolving " + source.name + " (" + source.location() + ")");
    return build(source, fetch(source));
}

cache::QueryData QueryResolver::describe_online(const sources::QuerySource& source) {
    connect();
    
    describe::QueryDescription desc;
    auto guard = core::execute_with_crash_guard(
        [&]() { desc = describer_->describe(source.sql); },
        "describing " + source.name);
    
    if (guard.crashed) {
        LOG_ERROR(guard.description);
        throw core::ResolveError(core::ResolveErrorKind::DriverCrash, guard.description);
    }
    
    auto data = cache::QueryData::make(db_name_, source.sql, std::move(desc));
    if (config_.save_to_cache) {
        cache_.save(data);
    }
    return data;
}

cache::QueryData QueryResolver::load_offline(const sources::QuerySource& source) const {
    auto data = cache_.load(source.sql);
    if (data) {
        return *data;
    }
    
    if (config_.offline_forced()) {
        throw core::ResolveError(core::ResolveErrorKind::OfflineDataMissing,
            "`QUERYLENS_OFFLINE=true` but there is no cached data for this query, "
            "run `querylens prepare` to update the query cache or unset `QUERYLENS_OFFLINE`");
    }
    throw core::ResolveError(core::ResolveErrorKind::OfflineDataMissing,
        "`QUERYLENS_CONNECTION` is not set and there is no cached data for this query "
        "in " + cache_.dir().string() +
        ", run `querylens prepare` to update the query cache or set `QUERYLENS_CONNECTION`");
}

ResolvedQuery QueryResolver::build(const sources::QuerySource& source, cache::QueryData data) {
    ResolvedQuery resolved;
    resolved.source = source;
    
    const auto& desc = data.describe;
    TypeMapper mapper(data.db_name);
    
    if (!source.param_names.empty() && source.param_names.size() != desc.parameters.size()) {
        throw core::ResolveError(core::ResolveErrorKind::ParameterCount,
            "expected " + std::to_string(desc.parameters.size()) + " parameters, got " +
            std::to_string(source.param_names.size()));
    }
    
    std::map<std::string, int> param_fields;  // field name -> ordinal
    for (size_t i = 0; i < desc.parameters.size(); ++i) {
        const auto& param = desc.parameters[i];
        std::string field = source.param_names.empty()
            ? "p" + std::to_string(param.ordinal)
            : utils::sanitize_identifier(source.param_names[i]);
        
        auto [it, inserted] = param_fields.emplace(field, param.ordinal);
        if (!inserted) {
            throw core::ResolveError(core::ResolveErrorKind::SourceSyntax,
                source.location() + ": duplicate parameter name \"" + field +
                "\" (parameters #" + std::to_string(it->second) + " and #" +
                std::to_string(param.ordinal) + ")");
        }
        resolved.parameters.push_back(mapper.map_parameter(param, field));
    }
    
    std::map<std::string, int> fields;  // field name -> ordinal
    for (const auto& column : desc.columns) {
        ColumnOverride ov = parse_column_override(column.name);
        ResolvedColumn mapped = mapper.map_column(column, ov);
        
        auto [it, inserted] = fields.emplace(mapped.field_name, mapped.ordinal);
        if (!inserted) {
            throw core::ResolveError(core::ResolveErrorKind::InvalidOverride,
                "duplicate column name \"" + mapped.field_name + "\" (columns #" +
                std::to_string(it->second) + " and #" + std::to_string(mapped.ordinal) + ")");
        }
        resolved.columns.push_back(std::move(mapped));
    }
    
    resolved.data = std::move(data);
    return resolved;
}

} // namespace querylens::resolver
