#include "picker.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <cli/theme.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>

std::optional<bool> parse_yes_no(const std::string& answer) {
    std::string a = answer;
    trim(a);
    std::transform(a.begin(), a.end(), a.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (a == "y" || a == "yes" || a == "true" || a == "1") return true;
    if (a == "n" || a == "no" || a == "false" || a == "0") return false;
    return std::nullopt;
}

// ── InteractivePicker ───────────────────────────────────────

InteractivePicker::InteractivePicker(std::istream& in, std::ostream& out)
    : in_(in), out_(out) {}

std::string InteractivePicker::read_line(const DecisionPoint& point) {
    std::string answer;
    if (!std::getline(in_, answer)) {
        throw PickerError(point.id, fmt::format("input closed while waiting for '{}'", point.id));
    }
    trim(answer);
    return answer;
}

bool InteractivePicker::confirm(const DecisionPoint& point) {
    auto fallback = parse_yes_no(point.fallback);
    std::string hint = !fallback ? "y/n" : (*fallback ? "Y/n" : "y/N");

    while (true) {
        out_ << theme::color::BROWN << "    " << point.prompt << " [" << hint << "]: "
             << theme::color::RESET;
        out_.flush();

        std::string answer = read_line(point);
        if (answer.empty() && fallback) return *fallback;
        if (auto yes = parse_yes_no(answer)) return *yes;
        out_ << theme::fail("Please answer y or n");
    }
}

std::string InteractivePicker::pick_one(const DecisionPoint& point,
                                        const std::vector<std::string>& options) {
    if (options.empty()) {
        throw PickerError(point.id, fmt::format("no options to choose from for '{}'", point.id));
    }

    int default_idx = -1;
    for (size_t i = 0; i < options.size(); ++i) {
        if (options[i] == point.fallback) default_idx = static_cast<int>(i);
    }

    out_ << "\n" << theme::dim("    " + point.prompt) << "\n";
    for (size_t i = 0; i < options.size(); ++i) {
        out_ << theme::color::BROWN << "      " << (i + 1) << theme::color::RESET
             << "  " << options[i] << "\n";
    }

    while (true) {
        out_ << theme::color::BROWN << "    Choice";
        if (default_idx >= 0) out_ << " [" << (default_idx + 1) << "]";
        out_ << ": " << theme::color::RESET;
        out_.flush();

        std::string answer = read_line(point);
        if (answer.empty() && default_idx >= 0) return options[default_idx];

        int n = safe_stoi(answer, 0);
        if (n >= 1 && n <= static_cast<int>(options.size())) return options[n - 1];

        auto it = std::find(options.begin(), options.end(), answer);
        if (it != options.end()) return *it;

        out_ << theme::fail(fmt::format("Enter a number between 1 and {}", options.size()));
    }
}

std::string InteractivePicker::input_text(const DecisionPoint& point,
                                          const TextValidator& validator) {
    while (true) {
        std::string suffix = point.fallback.empty() ? ": " : " [" + point.fallback + "]: ";
        out_ << theme::color::BROWN << "    " << point.prompt << suffix << theme::color::RESET;
        out_.flush();

        std::string answer = read_line(point);
        if (answer.empty()) answer = point.fallback;
        if (answer.empty()) {
            out_ << theme::fail("A value is required");
            continue;
        }
        if (validator) {
            if (auto problem = validator(answer)) {
                out_ << theme::fail(*problem);
                continue;
            }
        }
        return answer;
    }
}

// ── HeadlessPicker ──────────────────────────────────────────

HeadlessPicker::HeadlessPicker(std::map<std::string, std::string> defaults)
    : defaults_(std::move(defaults)) {}

const std::string& HeadlessPicker::answer_for(const DecisionPoint& point) const {
    auto it = defaults_.find(point.id);
    if (it == defaults_.end()) {
        throw PickerError(point.id, fmt::format(
            "headless run has no default for decision '{}' (set picker.defaults.{})",
            point.id, point.id));
    }
    return it->second;
}

bool HeadlessPicker::confirm(const DecisionPoint& point) {
    const auto& answer = answer_for(point);
    auto yes = parse_yes_no(answer);
    if (!yes) {
        throw PickerError(point.id, fmt::format(
            "default '{}' for decision '{}' is not yes/no", answer, point.id));
    }
    return *yes;
}

std::string HeadlessPicker::pick_one(const DecisionPoint& point,
                                     const std::vector<std::string>& options) {
    const auto& answer = answer_for(point);
    if (std::find(options.begin(), options.end(), answer) == options.end()) {
        throw PickerError(point.id, fmt::format(
            "default '{}' for decision '{}' is not one of the options", answer, point.id));
    }
    return answer;
}

std::string HeadlessPicker::input_text(const DecisionPoint& point,
                                       const TextValidator& validator) {
    const auto& answer = answer_for(point);
    if (validator) {
        if (auto problem = validator(answer)) {
            throw PickerError(point.id, fmt::format(
                "default for decision '{}' rejected: {}", point.id, *problem));
        }
    }
    return answer;
}

std::unique_ptr<Picker> make_picker(const PickerConfig& config,
                                    std::istream& in, std::ostream& out) {
    if (config.mode == PickerMode::Headless) {
        return std::make_unique<HeadlessPicker>(config.defaults);
    }
    return std::make_unique<InteractivePicker>(in, out);
}
