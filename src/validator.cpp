#include "validator.h"
#include "logger.h"

#define LOG_VALIDATOR_DEBUG(message) LOG_DEBUG("validator", message)

namespace kaddht {

ValidationResult FunctionValidator::validate(const std::string& key, const std::string& value) {
    if (!validate_fn_) {
        return ValidationResult::Reject("no validate function");
    }
    return validate_fn_(key, value);
}

SelectionResult FunctionValidator::select(const std::string& key, const std::vector<std::string>& values) {
    if (!select_fn_) {
        return SelectionResult::Error("no select function");
    }
    return select_fn_(key, values);
}

void NamespacedValidator::add_namespace(const std::string& ns, std::shared_ptr<Validator> validator) {
    validators_[ns] = std::move(validator);
}

bool NamespacedValidator::has_namespace(const std::string& ns) const {
    return validators_.find(ns) != validators_.end();
}

bool NamespacedValidator::split_key(const std::string& key, std::string& ns, std::string& rest) {
    if (key.size() < 2 || key[0] != '/') {
        return false;
    }
    size_t slash = key.find('/', 1);
    if (slash == std::string::npos || slash == 1) {
        return false;
    }
    ns = key.substr(1, slash - 1);
    rest = key.substr(slash + 1);
    return true;
}

Validator* NamespacedValidator::validator_for(const std::string& key) const {
    std::string ns, rest;
    if (!split_key(key, ns, rest)) {
        return nullptr;
    }
    auto it = validators_.find(ns);
    if (it == validators_.end()) {
        LOG_VALIDATOR_DEBUG("No validator registered for namespace '" << ns << "'");
        return nullptr;
    }
    return it->second.get();
}

ValidationResult NamespacedValidator::validate(const std::string& key, const std::string& value) {
    Validator* validator = validator_for(key);
    if (!validator) {
        return ValidationResult::Reject("invalid record keytype");
    }
    return validator->validate(key, value);
}

SelectionResult NamespacedValidator::select(const std::string& key, const std::vector<std::string>& values) {
    if (values.empty()) {
        return SelectionResult::Error("can't select from no values");
    }
    Validator* validator = validator_for(key);
    if (!validator) {
        return SelectionResult::Error("invalid record keytype");
    }
    return validator->select(key, values);
}

} // namespace kaddht
