#include "adapters/primary/cli/ExtensionsCommandHandler.hpp"
#include "adapters/primary/cli/CommandSupport.hpp"
#include <algorithm>
#include <cctype>

namespace nimbasms::adapters::primary::cli {

namespace {

const std::string ACTIONS_USAGE =
    "extensions actions list <extension_id> | create <extension_id> --name --method --endpoint --description | "
    "update <extension_id> <action_id> [fields] | delete <extension_id> <action_id> | "
    "publish <extension_id> <action_id>";

domain::AuthType authTypeArgument(const std::string& value) {
    auto type = domain::parseAuthType(value);
    if (!type) {
        throw UsageError("Unknown auth type '" + value + "', expected none, api_key or oauth2");
    }
    return *type;
}

domain::HttpMethod methodArgument(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto method = domain::parseHttpMethod(value);
    if (!method) {
        throw UsageError("Unknown HTTP method '" + value + "'");
    }
    return *method;
}

/**
 * @brief JSON объект из опции (--required-params '{"to": "string"}')
 */
std::optional<domain::ParamMap> paramMapArgument(const po::variables_map& vm, const std::string& name) {
    auto text = optionalArgument(vm, name);
    if (!text) {
        return std::nullopt;
    }

    auto j = nlohmann::json::parse(*text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw UsageError("--" + name + " must be a JSON object");
    }

    domain::ParamMap params;
    for (auto it = j.begin(); it != j.end(); ++it) {
        params[it.key()] = it.value();
    }
    return params;
}

void addActionFieldOptions(po::options_description& options, bool required) {
    auto text = [required]() {
        auto value = po::value<std::string>();
        return required ? value->required() : value;
    };
    options.add_options()
        ("name", text(), "action name")
        ("method", text(), "GET|POST|PUT|PATCH|DELETE")
        ("endpoint", text(), "endpoint path")
        ("description", text(), "description")
        ("required-params", po::value<std::string>(), "JSON object")
        ("optional-params", po::value<std::string>(), "JSON object")
        ("response-format", po::value<std::string>(), "JSON object");
}

/**
 * @brief Разбор OAuth2 опций; nullopt если ни одна не задана
 */
std::optional<domain::Result<domain::OAuth2Config>> oauth2Argument(const po::variables_map& vm) {
    if (!vm.count("oauth2-client-id") && !vm.count("oauth2-client-secret")
        && !vm.count("oauth2-authorization-url") && !vm.count("oauth2-token-url")
        && !vm.count("oauth2-redirect-url")) {
        return std::nullopt;
    }

    std::map<std::string, std::string> availableScopes;
    if (vm.count("oauth2-scope")) {
        for (const auto& scope : vm["oauth2-scope"].as<std::vector<std::string>>()) {
            auto eq = scope.find('=');
            if (eq == std::string::npos) {
                availableScopes[scope] = "";
            } else {
                availableScopes[scope.substr(0, eq)] = scope.substr(eq + 1);
            }
        }
    }

    std::vector<std::string> requiredScopes;
    if (vm.count("oauth2-required-scope")) {
        requiredScopes = vm["oauth2-required-scope"].as<std::vector<std::string>>();
    }

    return domain::OAuth2Config::create(
        optionalArgument(vm, "oauth2-client-id").value_or(""),
        optionalArgument(vm, "oauth2-client-secret").value_or(""),
        optionalArgument(vm, "oauth2-authorization-url").value_or(""),
        optionalArgument(vm, "oauth2-token-url").value_or(""),
        vm["oauth2-scope-separator"].as<std::string>(),
        optionalArgument(vm, "oauth2-redirect-url").value_or(""),
        availableScopes,
        requiredScopes);
}

po::positional_options_description idsPositional(bool withAction) {
    po::positional_options_description positional;
    positional.add("extension-id", 1);
    if (withAction) {
        positional.add("action-id", 1);
    }
    return positional;
}

void addIdOptions(po::options_description& options, bool withAction) {
    options.add_options()
        ("extension-id", po::value<std::string>()->required(), "extension UUID");
    if (withAction) {
        options.add_options()
            ("action-id", po::value<std::string>()->required(), "action UUID");
    }
}

} // namespace

ExtensionsCommandHandler::ExtensionsCommandHandler(std::shared_ptr<ports::input::IGatewayProvider> provider)
    : provider_(std::move(provider))
{}

int ExtensionsCommandHandler::handle(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto [subcommand, rest] = splitSubcommand(args, usage());
    if (subcommand == "list") return list(rest, out, err);
    if (subcommand == "create") return create(rest, out, err);
    if (subcommand == "get") return get(rest, out, err);
    if (subcommand == "update") return update(rest, out, err);
    if (subcommand == "upload-logo") return uploadLogo(rest, out, err);
    if (subcommand == "actions") return actions(rest, out, err);
    throw UsageError("Unknown subcommand 'extensions " + subcommand + "'. Usage: " + usage());
}

// ============================================
// РАСШИРЕНИЯ
// ============================================

int ExtensionsCommandHandler::list(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions list");
    addPageOptions(options);
    addOutputOption(options);
    auto vm = parseArguments(args, options);
    auto format = outputFormat(vm);

    auto page = pageFrom(vm);
    if (!page) return reportError(err, page.error());

    return render(out, err, format, provider_->gateway()->listExtensions(*page));
}

int ExtensionsCommandHandler::create(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions create");
    options.add_options()
        ("name", po::value<std::string>()->required(), "extension name")
        ("description", po::value<std::string>()->required(), "description")
        ("base-api-url", po::value<std::string>()->required(), "base URL of the extension API")
        ("auth-type", po::value<std::string>()->default_value("none"), "none|api_key|oauth2")
        ("paid", po::bool_switch(), "extension is paid")
        ("documentation-url", po::value<std::string>(), "documentation URL")
        ("website-url", po::value<std::string>(), "website URL")
        ("oauth2-client-id", po::value<std::string>(), "OAuth2 client id")
        ("oauth2-client-secret", po::value<std::string>(), "OAuth2 client secret")
        ("oauth2-authorization-url", po::value<std::string>(), "OAuth2 authorization URL")
        ("oauth2-token-url", po::value<std::string>(), "OAuth2 token URL")
        ("oauth2-redirect-url", po::value<std::string>(), "OAuth2 redirect URL")
        ("oauth2-scope-separator", po::value<std::string>()->default_value(" "), "scope separator")
        ("oauth2-scope", po::value<std::vector<std::string>>()->composing(), "scope=description, repeatable")
        ("oauth2-required-scope", po::value<std::vector<std::string>>()->composing(), "required scope, repeatable");
    addOutputOption(options);
    auto vm = parseArguments(args, options);
    auto format = outputFormat(vm);

    std::optional<domain::OAuth2Config> oauth2;
    if (auto config = oauth2Argument(vm)) {
        if (!*config) return reportError(err, config->error());
        oauth2 = **config;
    }

    auto request = domain::CreateExtension::create(
        vm["name"].as<std::string>(),
        vm["description"].as<std::string>(),
        vm["base-api-url"].as<std::string>(),
        authTypeArgument(vm["auth-type"].as<std::string>()),
        vm["paid"].as<bool>(),
        optionalArgument(vm, "documentation-url"),
        optionalArgument(vm, "website-url"),
        oauth2);
    if (!request) return reportError(err, request.error());

    return render(out, err, format, provider_->gateway()->createExtension(*request));
}

int ExtensionsCommandHandler::get(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions get");
    addIdOptions(options, false);
    addOutputOption(options);
    auto vm = parseArguments(args, options, idsPositional(false));
    auto format = outputFormat(vm);

    return render(out, err, format, provider_->gateway()->getExtension(uuidArgument(vm, "extension-id")));
}

int ExtensionsCommandHandler::update(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions update");
    addIdOptions(options, false);
    options.add_options()
        ("name", po::value<std::string>(), "extension name")
        ("description", po::value<std::string>(), "description")
        ("base-api-url", po::value<std::string>(), "base URL of the extension API")
        ("documentation-url", po::value<std::string>(), "documentation URL")
        ("website-url", po::value<std::string>(), "website URL");
    addOutputOption(options);
    auto vm = parseArguments(args, options, idsPositional(false));
    auto format = outputFormat(vm);

    auto id = uuidArgument(vm, "extension-id");
    auto update = domain::ExtensionUpdate::create(
        optionalArgument(vm, "name"),
        optionalArgument(vm, "description"),
        optionalArgument(vm, "base-api-url"),
        optionalArgument(vm, "documentation-url"),
        optionalArgument(vm, "website-url"));
    if (!update) return reportError(err, update.error());

    return render(out, err, format, provider_->gateway()->updateExtension(id, *update));
}

int ExtensionsCommandHandler::uploadLogo(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions upload-logo");
    addIdOptions(options, false);
    options.add_options()
        ("path", po::value<std::string>()->required(), "PNG file");
    addOutputOption(options);
    auto positional = idsPositional(false);
    positional.add("path", 1);
    auto vm = parseArguments(args, options, positional);
    auto format = outputFormat(vm);

    return render(out, err, format,
                  provider_->gateway()->uploadLogo(uuidArgument(vm, "extension-id"), vm["path"].as<std::string>()));
}

// ============================================
// ДЕЙСТВИЯ
// ============================================

int ExtensionsCommandHandler::actions(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    auto [subcommand, rest] = splitSubcommand(args, ACTIONS_USAGE);
    if (subcommand == "list") return listActions(rest, out, err);
    if (subcommand == "create") return createAction(rest, out, err);
    if (subcommand == "update") return updateAction(rest, out, err);
    if (subcommand == "delete") return deleteAction(rest, out, err);
    if (subcommand == "publish") return publishAction(rest, out, err);
    throw UsageError("Unknown subcommand 'extensions actions " + subcommand + "'. Usage: " + ACTIONS_USAGE);
}

int ExtensionsCommandHandler::listActions(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions actions list");
    addIdOptions(options, false);
    addPageOptions(options);
    addOutputOption(options);
    auto vm = parseArguments(args, options, idsPositional(false));
    auto format = outputFormat(vm);

    auto id = uuidArgument(vm, "extension-id");
    auto page = pageFrom(vm);
    if (!page) return reportError(err, page.error());

    return render(out, err, format, provider_->gateway()->listActions(id, *page));
}

int ExtensionsCommandHandler::createAction(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions actions create");
    addIdOptions(options, false);
    addActionFieldOptions(options, true);
    addOutputOption(options);
    auto vm = parseArguments(args, options, idsPositional(false));
    auto format = outputFormat(vm);

    auto id = uuidArgument(vm, "extension-id");
    auto request = domain::ActionRequest::create(
        vm["name"].as<std::string>(),
        methodArgument(vm["method"].as<std::string>()),
        vm["endpoint"].as<std::string>(),
        vm["description"].as<std::string>(),
        paramMapArgument(vm, "required-params").value_or(domain::ParamMap{}),
        paramMapArgument(vm, "optional-params").value_or(domain::ParamMap{}),
        paramMapArgument(vm, "response-format").value_or(domain::ParamMap{}));
    if (!request) return reportError(err, request.error());

    return render(out, err, format, provider_->gateway()->createAction(id, *request));
}

int ExtensionsCommandHandler::updateAction(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions actions update");
    addIdOptions(options, true);
    addActionFieldOptions(options, false);
    addOutputOption(options);
    auto vm = parseArguments(args, options, idsPositional(true));
    auto format = outputFormat(vm);

    auto extensionId = uuidArgument(vm, "extension-id");
    auto actionId = uuidArgument(vm, "action-id");

    domain::ActionUpdate draft;
    draft.name = optionalArgument(vm, "name");
    if (auto method = optionalArgument(vm, "method")) {
        draft.method = methodArgument(*method);
    }
    draft.endpoint = optionalArgument(vm, "endpoint");
    draft.description = optionalArgument(vm, "description");
    draft.requiredParams = paramMapArgument(vm, "required-params");
    draft.optionalParams = paramMapArgument(vm, "optional-params");
    draft.responseFormat = paramMapArgument(vm, "response-format");

    auto update = domain::ActionUpdate::create(draft);
    if (!update) return reportError(err, update.error());

    return render(out, err, format, provider_->gateway()->updateAction(extensionId, actionId, *update));
}

int ExtensionsCommandHandler::deleteAction(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions actions delete");
    addIdOptions(options, true);
    auto vm = parseArguments(args, options, idsPositional(true));

    auto extensionId = uuidArgument(vm, "extension-id");
    auto actionId = uuidArgument(vm, "action-id");

    auto result = provider_->gateway()->deleteAction(extensionId, actionId);
    if (!result) return reportError(err, result.error());

    out << "Deleted action " << actionId.toString() << "\n";
    return 0;
}

int ExtensionsCommandHandler::publishAction(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    po::options_description options("extensions actions publish");
    addIdOptions(options, true);
    addOutputOption(options);
    auto vm = parseArguments(args, options, idsPositional(true));
    auto format = outputFormat(vm);

    return render(out, err, format, provider_->gateway()->publishAction(
        uuidArgument(vm, "extension-id"), uuidArgument(vm, "action-id")));
}

} // namespace nimbasms::adapters::primary::cli
