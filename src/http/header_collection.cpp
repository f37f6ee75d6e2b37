#include <relay/http/header_collection.h>
#include <algorithm>

namespace relay::http {

HeaderField::HeaderField(std::string name, std::string value)
    : name_(std::move(name)), value_(std::move(value)) {}

std::string HeaderField::serialize() const {
    std::string out;
    out.reserve(name_.size() + value_.size() + 4);
    out += name_;
    out += ": ";
    out += value_;
    out += "\r\n";
    return out;
}

void HeaderCollection::add(const std::string& name, const std::string& value) {
    fields_.emplace_back(name, value);
}

std::optional<std::string> HeaderCollection::value(const std::string& name) const {
    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&](const HeaderField& f) { return f.name() == name; });
    if (it != fields_.end()) {
        return it->value();
    }
    return std::nullopt;
}

std::vector<std::string> HeaderCollection::values(const std::string& name) const {
    std::vector<std::string> result;
    for (const auto& field : fields_) {
        if (field.name() == name) {
            result.push_back(field.value());
        }
    }
    return result;
}

bool HeaderCollection::has(const std::string& name) const {
    return std::any_of(fields_.begin(), fields_.end(),
                       [&](const HeaderField& f) { return f.name() == name; });
}

void HeaderCollection::remove(const std::string& name) {
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&](const HeaderField& f) { return f.name() == name; }),
                  fields_.end());
}

void HeaderCollection::replace(const std::string& name, const std::string& value) {
    remove(name);
    add(name, value);
}

void HeaderCollection::clear() {
    fields_.clear();
}

size_t HeaderCollection::size() const {
    return fields_.size();
}

bool HeaderCollection::empty() const {
    return fields_.empty();
}

std::string HeaderCollection::serialize() const {
    std::string out;
    for (const auto& field : fields_) {
        out += field.serialize();
    }
    return out;
}

HeaderCollection::iterator HeaderCollection::begin() {
    return fields_.begin();
}

HeaderCollection::iterator HeaderCollection::end() {
    return fields_.end();
}

HeaderCollection::const_iterator HeaderCollection::begin() const {
    return fields_.begin();
}

HeaderCollection::const_iterator HeaderCollection::end() const {
    return fields_.end();
}

void HeaderCollection::for_each(const std::function<void(HeaderField&)>& fn) {
    for (auto& field : fields_) {
        fn(field);
    }
}

void HeaderCollection::for_each(const std::function<void(const HeaderField&)>& fn) const {
    for (const auto& field : fields_) {
        fn(field);
    }
}

HeaderField& HeaderCollection::back() {
    return fields_.back();
}

} // namespace relay::http
