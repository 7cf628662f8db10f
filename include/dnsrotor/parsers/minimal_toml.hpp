// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnsrotor, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace dnsrotor
{
namespace parsers
{
namespace toml
{

class table;
class array;

using value_type = std::variant<std::monostate, int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Error raised for malformed input, carrying the 1-based line number.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &what, std::size_t line)
    : std::runtime_error("line " + std::to_string(line) + ": " + what), _line(line)
  {
  }

  std::size_t line() const { return _line; }

private:
  std::size_t _line;
};

class array
{
public:
  using container_type = std::vector<value_type>;
  using const_iterator = container_type::const_iterator;

  void push_back(value_type &&val) { _values.push_back(std::move(val)); }

  size_t size() const { return _values.size(); }
  bool empty() const { return _values.empty(); }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  const value_type &operator[](size_t idx) const { return _values[idx]; }

private:
  container_type _values;
};

class node
{
public:
  node() = default;
  node(const value_type &val) : _value(val) {}
  node(value_type &&val) : _value(std::move(val)) {}

  bool is_value() const { return !std::holds_alternative<std::monostate>(_value); }
  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<int64_t>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }

  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, int64_t>)
    {
      if (auto *val = std::get_if<int64_t>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, double>)
    {
      if (auto *val = std::get_if<double>(&_value))
        return *val;
      if (auto *val = std::get_if<int64_t>(&_value))
        return static_cast<double>(*val);
    }
    else if constexpr (std::is_same_v<T, bool>)
    {
      if (auto *val = std::get_if<bool>(&_value))
        return *val;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
      if (auto *val = std::get_if<std::string>(&_value))
        return *val;
    }
    return std::nullopt;
  }

  const array *as_array() const
  {
    if (auto *val = std::get_if<std::shared_ptr<array>>(&_value))
      return val->get();
    return nullptr;
  }

  table *as_table()
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  const table *as_table() const
  {
    if (auto *val = std::get_if<std::shared_ptr<table>>(&_value))
      return val->get();
    return nullptr;
  }

  explicit operator bool() const { return is_value(); }

private:
  value_type _value;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;
  using const_iterator = container_type::const_iterator;

  bool contains(const std::string &key) const { return _values.find(key) != _values.end(); }
  bool empty() const { return _values.empty(); }
  size_t size() const { return _values.size(); }

  node &operator[](const std::string &key) { return _values[key]; }

  /// \brief Looks up "a.b.c"; returns an empty node when any part is missing.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::stringstream ss(dottedPath);
    std::string part;
    std::vector<std::string> parts;
    while (std::getline(ss, part, '.'))
      parts.push_back(part);

    for (size_t i = 0; i < parts.size(); ++i)
    {
      auto it = current->_values.find(parts[i]);
      if (it == current->_values.end())
        return node();
      if (i + 1 == parts.size())
        return it->second;
      current = it->second.as_table();
      if (!current)
        return node();
    }
    return node();
  }

  const_iterator begin() const { return _values.begin(); }
  const_iterator end() const { return _values.end(); }

  void insert(const std::string &key, node &&value) { _values[key] = std::move(value); }

private:
  container_type _values;
};

/// \brief Parser for the TOML subset used by configuration files: [dotted.sections],
/// bare or dotted keys, strings, integers, floats, booleans and (nested) arrays.
class parser
{
public:
  explicit parser(std::string input) : _input(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;

    skipBlankLinesAndComments();
    while (!isEnd())
    {
      if (peek() == '[')
      {
        current = ensureTable(&root, parseSection());
      }
      else
      {
        std::string key = parseKey();
        skipInlineSpace();
        if (peek() != '=')
          throw parse_error("expected '=' after key '" + key + "'", _line);
        advance();
        skipInlineSpace();
        node value(parseValue());

        table *target = current;
        auto dot = key.rfind('.');
        if (dot != std::string::npos)
        {
          target = ensureTable(current, key.substr(0, dot));
          key = key.substr(dot + 1);
        }
        if (target->contains(key))
          throw parse_error("duplicate key '" + key + "'", _line);
        target->insert(key, std::move(value));
      }
      expectEndOfLine();
      skipBlankLinesAndComments();
    }
    return root;
  }

private:
  std::string _input;
  size_t _pos = 0;
  size_t _line = 1;

  bool isEnd() const { return _pos >= _input.size(); }
  char peek() const { return isEnd() ? '\0' : _input[_pos]; }

  char advance()
  {
    if (isEnd())
      return '\0';
    char c = _input[_pos++];
    if (c == '\n')
      ++_line;
    return c;
  }

  void skipInlineSpace()
  {
    while (peek() == ' ' || peek() == '\t')
      advance();
  }

  void skipComment()
  {
    if (peek() == '#')
    {
      while (!isEnd() && peek() != '\n')
        advance();
    }
  }

  void skipBlankLinesAndComments()
  {
    while (!isEnd())
    {
      char c = peek();
      if (std::isspace(static_cast<unsigned char>(c)))
        advance();
      else if (c == '#')
        skipComment();
      else
        break;
    }
  }

  // Inside arrays values may span lines and carry comments.
  void skipArraySpace()
  {
    skipBlankLinesAndComments();
  }

  void expectEndOfLine()
  {
    skipInlineSpace();
    skipComment();
    if (peek() == '\r')
      advance();
    if (!isEnd() && peek() != '\n')
      throw parse_error(std::string("unexpected character '") + peek() + "'", _line);
  }

  std::string parseSection()
  {
    advance(); // '['
    std::string section;
    while (!isEnd() && peek() != ']' && peek() != '\n')
    {
      if (!std::isspace(static_cast<unsigned char>(peek())))
        section += peek();
      advance();
    }
    if (peek() != ']')
      throw parse_error("unterminated section header", _line);
    advance();
    if (section.empty())
      throw parse_error("empty section name", _line);
    return section;
  }

  std::string parseKey()
  {
    std::string key;
    while (!isEnd())
    {
      char c = peek();
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.')
        key += advance();
      else
        break;
    }
    if (key.empty())
      throw parse_error(std::string("invalid key start '") + peek() + "'", _line);
    return key;
  }

  value_type parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return parseString();
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return parseBool();
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    throw parse_error("invalid value", _line);
  }

  std::string parseString()
  {
    char quote = advance();
    std::string str;
    while (!isEnd() && peek() != quote && peek() != '\n')
    {
      char c = advance();
      // Literal (single-quoted) strings take backslashes verbatim.
      if (c != '\\' || quote == '\'')
      {
        str += c;
        continue;
      }
      char esc = advance();
      switch (esc)
      {
      case 'n':
        str += '\n';
        break;
      case 't':
        str += '\t';
        break;
      case 'r':
        str += '\r';
        break;
      case '\\':
      case '"':
        str += esc;
        break;
      default:
        throw parse_error(std::string("unknown escape '\\") + esc + "'", _line);
      }
    }
    if (peek() != quote)
      throw parse_error("unterminated string", _line);
    advance();
    return str;
  }

  value_type parseArray()
  {
    advance(); // '['
    auto arr = std::make_shared<array>();
    skipArraySpace();

    while (!isEnd() && peek() != ']')
    {
      arr->push_back(parseValue());
      skipArraySpace();
      if (peek() == ',')
      {
        advance();
        skipArraySpace();
      }
      else if (peek() != ']')
      {
        throw parse_error("expected ',' or ']' in array", _line);
      }
    }

    if (peek() != ']')
      throw parse_error("unterminated array", _line);
    advance();
    return arr;
  }

  bool parseBool()
  {
    std::string word;
    while (std::isalpha(static_cast<unsigned char>(peek())))
      word += advance();

    if (word == "true")
      return true;
    if (word == "false")
      return false;
    throw parse_error("invalid boolean value '" + word + "'", _line);
  }

  value_type parseNumber()
  {
    std::string num;
    bool isFloat = false;

    if (peek() == '+' || peek() == '-')
      num += advance();

    while (!isEnd())
    {
      char c = peek();
      if (c == '_')
      {
        advance();
        continue;
      }
      if (c == '.' || c == 'e' || c == 'E')
        isFloat = true;
      else if (!std::isdigit(static_cast<unsigned char>(c)) &&
               !((c == '+' || c == '-') && isFloat))
        break;
      num += advance();
    }

    try
    {
      if (isFloat)
        return std::stod(num);
      return static_cast<int64_t>(std::stoll(num));
    }
    catch (const std::exception &)
    {
      throw parse_error("invalid number '" + num + "'", _line);
    }
  }

  table *ensureTable(table *root, const std::string &path)
  {
    std::stringstream ss(path);
    std::string part;
    table *current = root;
    while (std::getline(ss, part, '.'))
    {
      if (part.empty())
        throw parse_error("invalid table path '" + path + "'", _line);
      if (!current->contains(part))
        current->insert(part, node(std::make_shared<table>()));
      current = (*current)[part].as_table();
      if (!current)
        throw parse_error("key '" + part + "' is not a table", _line);
    }
    return current;
  }
};

inline table parse(const std::string &tomlString)
{
  parser p(tomlString);
  return p.parse();
}

inline table parse_file(const std::string &filename)
{
  std::ifstream file(filename);
  if (!file.is_open())
    throw std::runtime_error("Cannot open file: " + filename);

  std::stringstream buffer;
  buffer << file.rdbuf();
  try
  {
    return parse(buffer.str());
  }
  catch (const parse_error &e)
  {
    throw std::runtime_error(filename + ": " + e.what());
  }
}

} // namespace toml
} // namespace parsers
} // namespace dnsrotor
