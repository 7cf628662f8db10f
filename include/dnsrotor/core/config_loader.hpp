// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <dnsrotor/parsers/minimal_toml.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dnsrotor
{
namespace core
{
/// \brief Loads a TOML configuration file and exposes typed lookups by dotted key.
class ConfigLoader
{
public:
  /// \brief Constructs and loads a TOML configuration file.
  /// \throws std::runtime_error if the file cannot be read or parsed.
  explicit ConfigLoader(const std::string &filename) : _filename(filename) { load(); }

  /// \brief Re-reads the file. On failure the table is cleared and the parser
  /// message is kept in lastError().
  bool reload()
  {
    try
    {
      _table = parsers::toml::parse_file(_filename);
      _loaded = true;
      _lastError.clear();
      return true;
    }
    catch (const std::exception &e)
    {
      _table = parsers::toml::table{};
      _loaded = false;
      _lastError = e.what();
      return false;
    }
  }

  const parsers::toml::table &load()
  {
    if (!_loaded && !reload())
    {
      throw std::runtime_error("Failed to load configuration file: " + _lastError);
    }
    return _table;
  }

  bool isLoaded() const { return _loaded; }

  const std::string &filename() const { return _filename; }

  const std::string &lastError() const { return _lastError; }

  const parsers::toml::table &table() const { return _table; }

  /// \brief Gets a typed value from the configuration.
  /// \tparam T int64_t, double, bool or std::string
  template <typename T> std::optional<T> get(const std::string &dottedKey) const
  {
    auto node = _table.at_path(dottedKey);
    if (node && !node.is_array() && !node.is_table())
    {
      return node.as<T>();
    }
    return std::nullopt;
  }

  std::optional<int64_t> getInt(const std::string &key) const { return get<int64_t>(key); }

  std::optional<bool> getBool(const std::string &key) const { return get<bool>(key); }

  std::optional<std::string> getString(const std::string &key) const
  {
    return get<std::string>(key);
  }

  /// \brief Gets an array of strings.
  /// \throws std::runtime_error if any element is not a string.
  std::optional<std::vector<std::string>> getStringArray(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::string> result;
    for (const auto &elem : *arr)
    {
      auto *strVal = std::get_if<std::string>(&elem);
      if (!strVal)
      {
        throw std::runtime_error("ConfigLoader: Array element at '" + key + "' is not a string");
      }
      result.push_back(*strVal);
    }
    return result;
  }

  /// \brief Gets an array of two-element string arrays, e.g. [["a", "b"], ["c", "d"]].
  /// \throws std::runtime_error if any element does not have that shape.
  std::optional<std::vector<std::pair<std::string, std::string>>>
  getStringPairs(const std::string &key) const
  {
    auto node = _table.at_path(key);
    const auto *arr = node.as_array();
    if (!arr)
    {
      return std::nullopt;
    }
    std::vector<std::pair<std::string, std::string>> result;
    std::size_t index = 0;
    for (const auto &elem : *arr)
    {
      auto *inner = std::get_if<std::shared_ptr<parsers::toml::array>>(&elem);
      if (!inner || (*inner)->size() != 2)
      {
        throw std::runtime_error("ConfigLoader: Element " + std::to_string(index) + " of '" +
                                 key + "' is not a pair");
      }
      auto *first = std::get_if<std::string>(&(**inner)[0]);
      auto *second = std::get_if<std::string>(&(**inner)[1]);
      if (!first || !second)
      {
        throw std::runtime_error("ConfigLoader: Element " + std::to_string(index) + " of '" +
                                 key + "' must hold two strings");
      }
      result.emplace_back(*first, *second);
      ++index;
    }
    return result;
  }

private:
  std::string _filename;
  parsers::toml::table _table;
  bool _loaded = false;
  std::string _lastError;
};

} // namespace core
} // namespace dnsrotor
