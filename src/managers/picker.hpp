#pragma once

#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <core/types.hpp>

// Decision ids the launcher asks about
constexpr const char* DECISION_OPERATOR         = "operator";
constexpr const char* DECISION_SUBJECT          = "subject";
constexpr const char* DECISION_CONFIRM_TRANSFER = "confirm_transfer";
constexpr const char* DECISION_RETRY_MAPPING    = "retry_mapping";

struct DecisionPoint {
    std::string id;             // key into picker.defaults
    std::string prompt;
    std::string fallback;       // offered to an interactive operator, "" for none
};

// Returns an error message for invalid input, nullopt when acceptable.
using TextValidator = std::function<std::optional<std::string>(const std::string&)>;

// Operator decision capability. Implementations either ask a person or
// answer from configuration; callers never know which.
class Picker {
public:
    virtual ~Picker() = default;

    virtual bool confirm(const DecisionPoint& point) = 0;
    virtual std::string pick_one(const DecisionPoint& point,
                                 const std::vector<std::string>& options) = 0;
    virtual std::string input_text(const DecisionPoint& point,
                                   const TextValidator& validator = nullptr) = 0;
};

// Prompts on a stream pair and blocks until valid input arrives.
// Closed input throws PickerError.
class InteractivePicker : public Picker {
public:
    InteractivePicker(std::istream& in, std::ostream& out);

    bool confirm(const DecisionPoint& point) override;
    std::string pick_one(const DecisionPoint& point,
                         const std::vector<std::string>& options) override;
    std::string input_text(const DecisionPoint& point,
                           const TextValidator& validator = nullptr) override;

private:
    std::string read_line(const DecisionPoint& point);

    std::istream& in_;
    std::ostream& out_;
};

// Answers from picker.defaults; a decision without a usable default
// throws PickerError at once.
class HeadlessPicker : public Picker {
public:
    explicit HeadlessPicker(std::map<std::string, std::string> defaults);

    bool confirm(const DecisionPoint& point) override;
    std::string pick_one(const DecisionPoint& point,
                         const std::vector<std::string>& options) override;
    std::string input_text(const DecisionPoint& point,
                           const TextValidator& validator = nullptr) override;

private:
    const std::string& answer_for(const DecisionPoint& point) const;

    std::map<std::string, std::string> defaults_;
};

// Parse yes/no style answers ("y", "yes", "true", "1", ...).
std::optional<bool> parse_yes_no(const std::string& answer);

std::unique_ptr<Picker> make_picker(const PickerConfig& config,
                                    std::istream& in, std::ostream& out);
