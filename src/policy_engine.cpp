/**
 * @file policy_engine.cpp
 * @brief Implementation of the policy engine factory
 */

#include <rbac/policy_engine.hpp>

#include <rbac/integration/logger_adapter.hpp>

namespace rbac {

auto policy_engine::open(const config::engine_config& config,
                         std::shared_ptr<di::ILogger> logger)
    -> Result<std::unique_ptr<policy_engine>> {
    auto valid = config.validate();
    if (valid.is_err()) {
        return Result<std::unique_ptr<policy_engine>>(valid.error());
    }

    integration::logger_adapter::initialize(config.logging);

    auto database = storage::policy_database::open(config.database_path,
                                                   config.database);
    if (database.is_err()) {
        return Result<std::unique_ptr<policy_engine>>(database.error());
    }

    auto engine = std::unique_ptr<policy_engine>(new policy_engine());
    engine->logger_ = logger ? std::move(logger)
                             : std::make_shared<di::LoggerService>();
    engine->database_ = std::move(database.value());
    engine->adapter_ =
        std::make_shared<storage::sqlite_policy_adapter>(engine->database_);
    engine->metadata_ = std::make_shared<storage::sqlite_role_metadata_storage>(
        engine->database_);
    engine->graph_ = std::make_shared<security::in_memory_role_graph>(
        config.max_hierarchy_depth);

    security::delegate_options options;
    options.admin_role_ref = config.admin_role;
    engine->delegate_ = std::make_unique<security::policy_delegate>(
        engine->adapter_, engine->graph_, engine->metadata_, engine->database_,
        options, engine->logger_);

    engine->audit_subscription_ = engine->delegate_->subscribe_role_added(
        [](const security::role_added_event& event) {
            for (const auto& role : event.role_entity_refs) {
                integration::logger_adapter::log_policy_event(
                    integration::policy_event_type::role_created, role);
            }
        });

    auto loaded = engine->reload_role_graph();
    if (loaded.is_err()) {
        return Result<std::unique_ptr<policy_engine>>(loaded.error());
    }

    engine->logger_->info_fmt("Policy engine opened on {} (schema v{})",
                              config.database_path,
                              engine->database_->schema_version());
    return engine;
}

policy_engine::~policy_engine() {
    if (delegate_) {
        delegate_->unsubscribe(audit_subscription_);
    }
    integration::logger_adapter::flush();
}

auto policy_engine::reload_role_graph() -> VoidResult {
    security::policy_model model;
    auto loaded = adapter_->load_filtered_policy(
        model, {security::policy_filter::all("g")});
    if (loaded.is_err()) {
        return loaded;
    }

    graph_->clear();
    auto rules = model.get_policy(security::policy_section::grouping, "g");
    for (const auto& rule : rules) {
        auto linked = graph_->add_link(rule[0], rule[1]);
        if (linked.is_err()) {
            return linked;
        }
    }

    logger_->debug_fmt("Role graph rebuilt from {} grouping rules", rules.size());
    return ok();
}

}  // namespace rbac
