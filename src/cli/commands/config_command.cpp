#include "config_command.h"
#include "core/run_plan.h"
#include "utils/string_utils.h"

namespace monthclose::cli::commands {

ConfigCommand::ConfigCommand(std::shared_ptr<core::ConfigManager> config_manager,
                             std::shared_ptr<core::output::IOutput> output)
    : config_manager_(std::move(config_manager)), output_(std::move(output)) {
}

int ConfigCommand::execute(const ParsedArgs& args) {
    if (args.subcommand_args.empty()) {
        return list(args);
    }

    const auto& action = args.subcommand_args[0];

    if (action == "list") {
        return list(args);
    } else if (action == "get") {
        return get(args);
    } else if (action == "set") {
        return set(args);
    } else if (action == "unset") {
        return unset(args);
    } else if (action == "add-root") {
        return add_root(args);
    } else if (action == "remove-root") {
        return remove_root(args);
    }

    output_->error("Unknown config action: " + action);
    output_->info("Available actions: list, get, set, unset, add-root, remove-root");
    return core::kExitConfigError;
}

int ConfigCommand::list(const ParsedArgs& /*args*/) {
    const auto& roots = config_manager_->get_storage_roots();
    auto keys = config_manager_->list_keys();

    std::string text;
    if (roots.empty() && keys.empty()) {
        text = "(no configuration set)\n";
    }

    if (!roots.empty()) {
        text += "Storage roots:\n";
        for (const auto& root : roots) {
            text += "  " + root.string() + "\n";
        }
    }

    if (!keys.empty()) {
        if (!roots.empty()) text += "\n";
        text += "Settings:\n";
        for (const auto& key : keys) {
            text += "  " + key + " = " + config_manager_->get(key).value_or("") + "\n";
        }
    }

    output_->data(config_manager_->to_json(), text);
    return 0;
}

int ConfigCommand::get(const ParsedArgs& args) {
    const auto& key = args.subcommand;

    if (key == "storage_roots") {
        std::string text;
        for (const auto& root : config_manager_->get_storage_roots()) {
            text += root.string() + "\n";
        }
        output_->data({{"key", key}, {"value", config_manager_->to_json()["storage_roots"]}}, text);
        return 0;
    }

    auto value = config_manager_->get(key);
    if (!value) {
        output_->error("Config key not found: " + key);
        return 1;
    }

    output_->data({{"key", key}, {"value", *value}}, *value + "\n");
    return 0;
}

int ConfigCommand::set(const ParsedArgs& args) {
    if (args.subcommand.empty() || args.subcommand_args.size() < 2) {
        output_->error("Usage: monthclose config set <key> <value>");
        return core::kExitConfigError;
    }

    const auto& key = args.subcommand;
    std::string value = args.subcommand_args[1];

    if (key == "storage_roots") {
        output_->error("Use 'config add-root' / 'config remove-root' to manage storage roots");
        return core::kExitConfigError;
    }

    if (key == "build_log") {
        auto flag = utils::parse_bool(value);
        if (!flag) {
            output_->error("build_log must be true or false, got '" + value + "'");
            return core::kExitConfigError;
        }
        value = *flag ? "true" : "false";
    }

    config_manager_->set(key, value);
    return save_and_report(args, "Set " + key + " = " + value,
                           {{"success", true}, {"key", key}, {"value", value}});
}

int ConfigCommand::unset(const ParsedArgs& args) {
    const auto& key = args.subcommand;

    if (!config_manager_->unset(key)) {
        output_->error("Config key not found: " + key);
        return 1;
    }

    return save_and_report(args, "Removed " + key, {{"success", true}, {"key", key}});
}

int ConfigCommand::add_root(const ParsedArgs& args) {
    std::filesystem::path dir(args.subcommand);
    config_manager_->add_storage_root(dir);
    return save_and_report(args, "Added storage root " + dir.string(),
                           {{"success", true}, {"storage_roots", config_manager_->to_json()["storage_roots"]}});
}

int ConfigCommand::remove_root(const ParsedArgs& args) {
    std::filesystem::path dir(args.subcommand);
    if (!config_manager_->remove_storage_root(dir)) {
        output_->error("Storage root not configured: " + dir.string());
        return 1;
    }
    return save_and_report(args, "Removed storage root " + dir.string(),
                           {{"success", true}, {"storage_roots", config_manager_->to_json()["storage_roots"]}});
}

int ConfigCommand::save_and_report(const ParsedArgs& args, const std::string& message, nlohmann::json j) {
    if (!config_manager_->save()) {
        output_->error("Failed to save configuration to " + config_manager_->config_file().string());
        return 1;
    }

    if (args.core_options.json_output) {
        output_->data(j, message);
    } else {
        output_->success(message);
    }
    return 0;
}

} // namespace monthclose::cli::commands
