/*
 * Copyright 2025 Jinwoo Sung
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "wsbridge/config/config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include "wsbridge/diagnostics/logger.hpp"

namespace wsbridge {
namespace config {

namespace {

bool type_of(const std::any& value, ConfigType& type) {
  if (value.type() == typeid(std::string)) {
    type = ConfigType::String;
  } else if (value.type() == typeid(int)) {
    type = ConfigType::Integer;
  } else if (value.type() == typeid(bool)) {
    type = ConfigType::Boolean;
  } else if (value.type() == typeid(double)) {
    type = ConfigType::Double;
  } else {
    return false;
  }
  return true;
}

std::string trim(const std::string& s) {
  const auto begin = s.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return "";
  const auto end = s.find_last_not_of(" \t\r");
  return s.substr(begin, end - begin + 1);
}

ConfigType guess_type(const std::string& value_str) {
  if (value_str == "true" || value_str == "false") {
    return ConfigType::Boolean;
  }
  const bool numeric = !value_str.empty() && std::all_of(value_str.begin(), value_str.end(), [](char c) {
    return std::isdigit(static_cast<unsigned char>(c)) || c == '-' || c == '.';
  });
  if (!numeric || !std::any_of(value_str.begin(), value_str.end(),
                               [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
    return ConfigType::String;
  }
  const auto dots = std::count(value_str.begin(), value_str.end(), '.');
  if (dots == 0) return ConfigType::Integer;
  if (dots == 1) return ConfigType::Double;
  return ConfigType::String;
}

}  // namespace

std::any ConfigManager::get(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    throw std::out_of_range("Configuration key not found: " + key);
  }
  return it->second.value;
}

std::any ConfigManager::get(const std::string& key, const std::any& default_value) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    return it->second.value;
  }
  return default_value;
}

bool ConfigManager::has(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.find(key) != config_items_.end();
}

ValidationResult ConfigManager::set(const std::string& key, const std::any& value) {
  ConfigChangeCallback callback;
  std::any old_value;
  {
    std::lock_guard<std::mutex> lock(mutex_);

    auto result = validate_value(key, value);
    if (!result.is_valid) {
      return result;
    }

    auto it = config_items_.find(key);
    if (it != config_items_.end()) {
      old_value = it->second.value;
      it->second.value = value;
      auto cb = change_callbacks_.find(key);
      if (cb != change_callbacks_.end()) {
        callback = cb->second;
      }
    } else {
      ConfigType type = ConfigType::String;
      if (!type_of(value, type)) {
        return ValidationResult::error("Unsupported value type for key '" + key + "'");
      }
      config_items_[key] = ConfigItem(key, value, type, false);
    }
  }

  if (callback) {
    try {
      callback(key, old_value, value);
    } catch (const std::exception& e) {
      WSBRIDGE_LOG_ERROR("config_manager", "set", "Change callback for '" + key + "' threw: " + e.what());
    }
  }
  return ValidationResult::success();
}

bool ConfigManager::remove(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return config_items_.erase(key) > 0;
}

void ConfigManager::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_.clear();
}

ValidationResult ConfigManager::validate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [key, item] : config_items_) {
    if (item.required && !item.value.has_value()) {
      return ValidationResult::error("Required configuration key has no value: " + key);
    }
    if (!item.value.has_value()) {
      continue;
    }
    auto result = validate_value(key, item.value);
    if (!result.is_valid) {
      return result;
    }
  }
  return ValidationResult::success();
}

ValidationResult ConfigManager::validate(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    return ValidationResult::error("Configuration key not found: " + key);
  }
  if (!it->second.value.has_value()) {
    return it->second.required ? ValidationResult::error("Required configuration key has no value: " + key)
                               : ValidationResult::success();
  }
  return validate_value(key, it->second.value);
}

void ConfigManager::register_item(const ConfigItem& item) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_items_[item.key] = item;
}

void ConfigManager::register_validator(const std::string& key, ConfigValidator validator) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it != config_items_.end()) {
    it->second.validator = std::move(validator);
  } else {
    WSBRIDGE_LOG_WARNING("config_manager", "register_validator", "Unknown key: " + key);
  }
}

void ConfigManager::on_change(const std::string& key, ConfigChangeCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_callbacks_[key] = std::move(callback);
}

void ConfigManager::remove_change_callback(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  change_callbacks_.erase(key);
}

bool ConfigManager::save_to_file(const std::string& filepath) const {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ofstream file(filepath);
  if (!file.is_open()) {
    WSBRIDGE_LOG_ERROR("config_manager", "save", "Cannot open " + filepath);
    return false;
  }

  std::vector<std::string> keys;
  keys.reserve(config_items_.size());
  for (const auto& entry : config_items_) {
    keys.push_back(entry.first);
  }
  std::sort(keys.begin(), keys.end());

  file << "# wsbridge configuration\n\n";
  for (const auto& key : keys) {
    const auto& item = config_items_.at(key);
    if (!item.value.has_value()) continue;
    if (!item.description.empty()) {
      file << "# " << item.description << "\n";
    }
    file << key << "=" << serialize_value(item.value, item.type) << "\n";
  }
  return static_cast<bool>(file);
}

bool ConfigManager::load_from_file(const std::string& filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    WSBRIDGE_LOG_WARNING("config_manager", "load", "Cannot open " + filepath);
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  std::string line;
  size_t line_no = 0;
  while (std::getline(file, line)) {
    ++line_no;
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    const auto pos = line.find('=');
    if (pos == std::string::npos) {
      WSBRIDGE_LOG_WARNING("config_manager", "load",
                           filepath + ":" + std::to_string(line_no) + ": expected key=value");
      continue;
    }

    const std::string key = trim(line.substr(0, pos));
    const std::string value_str = trim(line.substr(pos + 1));
    if (key.empty()) {
      continue;
    }

    auto it = config_items_.find(key);
    if (it != config_items_.end()) {
      std::any value = deserialize_value(value_str, it->second.type);
      if (validate_value(key, value).is_valid) {
        it->second.value = std::move(value);
      } else {
        WSBRIDGE_LOG_WARNING("config_manager", "load", "Ignoring invalid value for " + key);
      }
    } else {
      const ConfigType type = guess_type(value_str);
      config_items_[key] = ConfigItem(key, deserialize_value(value_str, type), type, false);
    }
  }
  return true;
}

std::vector<std::string> ConfigManager::get_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> keys;
  keys.reserve(config_items_.size());
  for (const auto& entry : config_items_) {
    keys.push_back(entry.first);
  }
  return keys;
}

ConfigType ConfigManager::get_type(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    throw std::out_of_range("Configuration key not found: " + key);
  }
  return it->second.type;
}

std::string ConfigManager::get_description(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  return it != config_items_.end() ? it->second.description : "";
}

bool ConfigManager::is_required(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = config_items_.find(key);
  return it != config_items_.end() && it->second.required;
}

ValidationResult ConfigManager::validate_value(const std::string& key, const std::any& value) const {
  auto it = config_items_.find(key);
  if (it == config_items_.end()) {
    return ValidationResult::success();
  }

  ConfigType actual = ConfigType::String;
  if (!type_of(value, actual) || actual != it->second.type) {
    return ValidationResult::error("Type mismatch for key '" + key + "'");
  }
  if (it->second.validator) {
    return it->second.validator(value);
  }
  return ValidationResult::success();
}

std::string ConfigManager::serialize_value(const std::any& value, ConfigType type) const {
  try {
    switch (type) {
      case ConfigType::String:
        return std::any_cast<std::string>(value);
      case ConfigType::Integer:
        return std::to_string(std::any_cast<int>(value));
      case ConfigType::Boolean:
        return std::any_cast<bool>(value) ? "true" : "false";
      case ConfigType::Double:
        return std::to_string(std::any_cast<double>(value));
    }
  } catch (const std::bad_any_cast&) {
    WSBRIDGE_LOG_WARNING("config_manager", "save", "Value does not match its declared type");
  }
  return "";
}

std::any ConfigManager::deserialize_value(const std::string& value_str, ConfigType type) const {
  try {
    switch (type) {
      case ConfigType::String:
        return std::any(value_str);
      case ConfigType::Integer:
        return std::any(std::stoi(value_str));
      case ConfigType::Boolean:
        return std::any(value_str == "true");
      case ConfigType::Double:
        return std::any(std::stod(value_str));
    }
  } catch (const std::exception& e) {
    WSBRIDGE_LOG_WARNING("config_manager", "load", "Keeping '" + value_str + "' as text: " + e.what());
  }
  return std::any(value_str);
}

}  // namespace config
}  // namespace wsbridge
