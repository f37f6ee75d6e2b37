#pragma once
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace relay::http {

class HeaderField {
public:
    HeaderField(std::string name, std::string value);

    const std::string& name() const { return name_; }
    const std::string& value() const { return value_; }
    void set_value(std::string value) { value_ = std::move(value); }

    // "name: value\r\n"
    std::string serialize() const;

private:
    std::string name_;
    std::string value_;
};

// Ordered header store. Names match exactly (no case folding) and
// duplicates are kept, so several Set-Cookie fields survive side by side.
class HeaderCollection {
public:
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> value(const std::string& name) const;
    std::vector<std::string> values(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);
    void replace(const std::string& name, const std::string& value);
    void clear();
    size_t size() const;
    bool empty() const;

    // Wire form of every field in insertion order.
    std::string serialize() const;

    // Iteration in insertion order; restartable.
    using iterator = std::vector<HeaderField>::iterator;
    using const_iterator = std::vector<HeaderField>::const_iterator;
    iterator begin();
    iterator end();
    const_iterator begin() const;
    const_iterator end() const;

    void for_each(const std::function<void(HeaderField&)>& fn);
    void for_each(const std::function<void(const HeaderField&)>& fn) const;

    // Last field added; used by the parser to fold continuation lines.
    HeaderField& back();

private:
    std::vector<HeaderField> fields_;
};

} // namespace relay::http
