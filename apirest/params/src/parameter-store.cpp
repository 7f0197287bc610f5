#include "apirest/parameter-store.hpp"

#include <cstdint>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "apirest/parameter.hpp"
#include "apirest/string-trim.hpp"

namespace apirest {

void ParameterStore::add(Parameter param) {
  std::scoped_lock lock(_mutex);
  auto it = _entries.find(param.name);
  if (it == _entries.end()) {
    it = _entries.emplace(param.name, Entry{}).first;
  }
  it->second.definition = std::move(param);
}

void ParameterStore::set(std::string_view name, std::string_view value) {
  std::scoped_lock lock(_mutex);
  auto it = _entries.find(name);
  if (it == _entries.end()) {
    it = _entries.emplace(std::string(name), Entry{}).first;
  }
  it->second.value = std::string(value);
}

bool ParameterStore::unset(std::string_view name) {
  std::scoped_lock lock(_mutex);
  auto it = _entries.find(name);
  if (it == _entries.end() || !it->second.value) {
    return false;
  }
  it->second.value.reset();
  return true;
}

bool ParameterStore::isRegistered(std::string_view name) const {
  std::scoped_lock lock(_mutex);
  auto it = _entries.find(name);
  return it != _entries.end() && it->second.definition.has_value();
}

std::optional<std::string> ParameterStore::rawValue(std::string_view name) const {
  std::scoped_lock lock(_mutex);
  auto it = _entries.find(name);
  if (it == _entries.end()) {
    return std::nullopt;
  }
  return it->second.value;
}

std::vector<Parameter> ParameterStore::parameters() const {
  std::scoped_lock lock(_mutex);
  std::vector<Parameter> ret;
  for (const auto& [name, entry] : _entries) {
    if (entry.definition) {
      ret.push_back(*entry.definition);
    }
  }
  return ret;
}

std::string ParameterStore::validatedValue(std::string_view name, ParamType expectedType) const {
  std::string value;
  ParamValidator validator;
  {
    std::scoped_lock lock(_mutex);
    auto it = _entries.find(name);
    if (it == _entries.end() || !it->second.definition) {
      throw ParameterError(std::format("parameter {} is not registered", name));
    }
    const Parameter& definition = *it->second.definition;
    if (definition.type != expectedType) {
      throw ParameterError(std::format("parameter {} is of type {}, not {}", name, ParamTypeName(definition.type),
                                       ParamTypeName(expectedType)));
    }
    value = it->second.value.value_or(definition.defaultValue);
    validator = definition.validator;
  }

  // validator runs outside of the lock, it is user code
  switch (expectedType) {
    case ParamType::Int:
      if (!ParseInt(value)) {
        throw ParameterError(std::format("parameter {} is not a valid integer: '{}'", name, value));
      }
      break;
    case ParamType::Bool:
      if (!ParseBool(value)) {
        throw ParameterError(std::format("parameter {} is not a valid boolean: '{}'", name, value));
      }
      break;
    default:
      break;
  }
  if (validator && !validator(value)) {
    throw ParameterError(std::format("parameter {} has an invalid value: '{}'", name, value));
  }
  return value;
}

std::string ParameterStore::getString(std::string_view name) const {
  return validatedValue(name, ParamType::String);
}

int64_t ParameterStore::getInt(std::string_view name) const {
  return *ParseInt(validatedValue(name, ParamType::Int));
}

bool ParameterStore::getBool(std::string_view name) const { return *ParseBool(validatedValue(name, ParamType::Bool)); }

void SetParameterAssignment(ParameterStore& store, std::string_view assignment) {
  const auto eqPos = assignment.find('=');
  if (eqPos == std::string_view::npos) {
    throw ParameterError(std::format("expected 'key=value', got '{}'", assignment));
  }
  const auto key = TrimOws(assignment.substr(0, eqPos));
  if (key.empty()) {
    throw ParameterError(std::format("empty parameter name in '{}'", assignment));
  }
  store.set(key, TrimOws(assignment.substr(eqPos + 1)));
}

void LoadParameterFile(ParameterStore& store, const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    throw ParameterError(std::format("unable to open parameter file {}", path.string()));
  }
  std::string line;
  for (int lineNumber = 1; std::getline(in, line); ++lineNumber) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const auto trimmed = TrimOws(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    try {
      SetParameterAssignment(store, trimmed);
    } catch (const ParameterError& ex) {
      throw ParameterError(std::format("{}:{}: {}", path.string(), lineNumber, ex.what()));
    }
  }
}

}  // namespace apirest
