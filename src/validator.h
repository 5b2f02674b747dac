#pragma once

#include "kaddht_export.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>

namespace kaddht {

/**
 * Result of validating a record value
 */
struct ValidationResult {
    bool valid = false;
    std::string reason;     // Why the value was rejected

    static ValidationResult Accept() {
        ValidationResult r;
        r.valid = true;
        return r;
    }
    static ValidationResult Reject(const std::string& why) {
        ValidationResult r;
        r.reason = why;
        return r;
    }
};

/**
 * Result of choosing the preferred value among candidates
 */
struct SelectionResult {
    bool success = false;
    size_t index = 0;       // Index of the preferred value
    std::string error_message;

    static SelectionResult Selected(size_t i) {
        SelectionResult r;
        r.success = true;
        r.index = i;
        return r;
    }
    static SelectionResult Error(const std::string& msg) {
        SelectionResult r;
        r.error_message = msg;
        return r;
    }
};

/**
 * Application-defined record semantics: which values are acceptable under a
 * key, and which of several acceptable values should be kept.
 */
class KADDHT_API Validator {
public:
    virtual ~Validator() = default;

    virtual ValidationResult validate(const std::string& key, const std::string& value) = 0;
    virtual SelectionResult select(const std::string& key, const std::vector<std::string>& values) = 0;
};

using ValidateFunction = std::function<ValidationResult(const std::string& key, const std::string& value)>;
using SelectFunction = std::function<SelectionResult(const std::string& key, const std::vector<std::string>& values)>;

/**
 * Validator built from a pair of functions
 */
class KADDHT_API FunctionValidator : public Validator {
public:
    FunctionValidator(ValidateFunction validate_fn, SelectFunction select_fn)
        : validate_fn_(std::move(validate_fn)), select_fn_(std::move(select_fn)) {}

    ValidationResult validate(const std::string& key, const std::string& value) override;
    SelectionResult select(const std::string& key, const std::vector<std::string>& values) override;

private:
    ValidateFunction validate_fn_;
    SelectFunction select_fn_;
};

/**
 * Routes keys of the form "/<namespace>/<rest>" to the validator registered
 * for <namespace>. Keys of any other shape, or with an unregistered namespace,
 * are rejected.
 */
class KADDHT_API NamespacedValidator : public Validator {
public:
    void add_namespace(const std::string& ns, std::shared_ptr<Validator> validator);
    bool has_namespace(const std::string& ns) const;

    ValidationResult validate(const std::string& key, const std::string& value) override;
    SelectionResult select(const std::string& key, const std::vector<std::string>& values) override;

    /**
     * Extract the namespace of a key
     * @return false if the key has no "/<ns>/<rest>" shape
     */
    static bool split_key(const std::string& key, std::string& ns, std::string& rest);

private:
    Validator* validator_for(const std::string& key) const;

    std::unordered_map<std::string, std::shared_ptr<Validator>> validators_;
};

} // namespace kaddht
