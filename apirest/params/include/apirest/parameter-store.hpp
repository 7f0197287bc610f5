#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "apirest/parameter.hpp"

namespace apirest {

// Thread-safe registry of named, typed parameters.
// Values are stored as raw strings and validated when read through the typed getters, so that an invalid value
// set at runtime is reported to whoever consumes it, with the parameter name and the offending value.
class ParameterStore {
 public:
  // Register a parameter. Registering an existing name replaces its definition but keeps any value already set.
  void add(Parameter param);

  // Store a raw value. Names need not be registered yet.
  void set(std::string_view name, std::string_view value);

  // Remove a stored value, reverting to the default. Returns false if no value was set.
  bool unset(std::string_view name);

  [[nodiscard]] bool isRegistered(std::string_view name) const;

  // Raw stored value, std::nullopt if the parameter only has its default.
  [[nodiscard]] std::optional<std::string> rawValue(std::string_view name) const;

  // Registered parameters sorted by name.
  [[nodiscard]] std::vector<Parameter> parameters() const;

  // Typed getters: the value (or default) of a registered parameter, checked against its type and validator.
  // Throw ParameterError on unknown parameters and invalid values.
  [[nodiscard]] std::string getString(std::string_view name) const;
  [[nodiscard]] int64_t getInt(std::string_view name) const;
  [[nodiscard]] bool getBool(std::string_view name) const;

 private:
  struct Entry {
    std::optional<Parameter> definition;
    std::optional<std::string> value;
  };

  std::string validatedValue(std::string_view name, ParamType expectedType) const;

  mutable std::mutex _mutex;
  std::map<std::string, Entry, std::less<>> _entries;
};

// Fill the store from a file of 'key=value' lines. Blank lines and lines starting with '#' are skipped,
// whitespace around keys and values is trimmed. Throws ParameterError on unreadable files or malformed lines.
void LoadParameterFile(ParameterStore& store, const std::filesystem::path& path);

// Parse a single 'key=value' assignment (as given on a command line) into the store.
void SetParameterAssignment(ParameterStore& store, std::string_view assignment);

}  // namespace apirest
