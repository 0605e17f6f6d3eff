#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace spill {

// Minimal command-line parser for "--flag" and "--name value" options.
class ArgumentParser {
  public:
    // Options declared with takesValue consume the next token.
    void addArgument(const std::string& name, const std::string& description, bool takesValue = false);

    // Unknown options and missing values are collected in errors().
    void parse(int argc, const char* const argv[]);

    bool hasArgument(const std::string& name) const;
    std::string getArgument(const std::string& name, const std::string& fallback = "") const;

    const std::vector<std::string>& errors() const { return errors_; }
    std::string usage(std::string_view executable) const;

  private:
    struct Option {
        std::string name;
        std::string description;
        bool takesValue = false;
    };

    std::vector<Option> options_;
    std::unordered_map<std::string, std::string> values_;
    std::vector<std::string> errors_;
};

} // namespace spill
