// Copyright (c) 2025 pgbind Contributors
// SPDX-License-Identifier: GPL-3.0-or-later

#include <pgbind/bind/bind.h>
#include <pgbind/bind/template.h>

#include <mutex>

#include <nlohmann/json.hpp>

namespace pgbind {

Bind::Bind(std::initializer_list<BindPair> pairs) {
    for (const auto& [key, value] : pairs) {
        if (!key.empty()) {
            vars_.insert_or_assign(key, value);
        }
    }
}

Bind::Bind(NamedArgs vars) : vars_(std::move(vars)) {
    vars_.erase("");
}

std::unique_ptr<Bind> Bind::copy(std::initializer_list<BindPair> overrides) const {
    NamedArgs vars;
    {
        std::shared_lock lock(mutex_);
        vars = vars_;
    }
    for (const auto& [key, value] : overrides) {
        if (!key.empty()) {
            vars.insert_or_assign(key, value);
        }
    }
    return std::make_unique<Bind>(std::move(vars));
}

std::string Bind::set(std::string_view key, Value value) {
    if (key.empty()) {
        return {};
    }
    std::unique_lock lock(mutex_);
    vars_.insert_or_assign(std::string(key), std::move(value));
    return "@" + std::string(key);
}

std::optional<Value> Bind::get(std::string_view key) const {
    std::shared_lock lock(mutex_);
    auto it = vars_.find(key);
    if (it == vars_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Bind::has(std::string_view key) const {
    std::shared_lock lock(mutex_);
    return vars_.find(key) != vars_.end();
}

void Bind::del(std::string_view key) {
    std::unique_lock lock(mutex_);
    auto it = vars_.find(key);
    if (it != vars_.end()) {
        vars_.erase(it);
    }
}

std::string Bind::join(std::string_view key, std::string_view sep) const {
    std::shared_lock lock(mutex_);
    auto it = vars_.find(key);
    if (it == vars_.end()) {
        return {};
    }
    if (!it->second.isSequence()) {
        return it->second.toString();
    }

    std::string out;
    bool first = true;
    for (const auto& item : it->second.elements()) {
        if (!first) {
            out.append(sep);
        }
        out += item;
        first = false;
    }
    return out;
}

bool Bind::append(std::string_view key, Value value) {
    if (key.empty()) {
        return false;
    }
    if (value.isSequence()) {
        // Sequences do not nest; a sequence is appended as one element
        value = Value(value.toString());
    }

    std::unique_lock lock(mutex_);
    auto it = vars_.find(key);
    if (it == vars_.end()) {
        if (value.isString()) {
            vars_.emplace(std::string(key), Value::StringList{value.get<std::string>()});
        } else {
            vars_.emplace(std::string(key), Value::List{value.toScalar()});
        }
        return true;
    }

    Value& current = it->second;
    if (current.holds<Value::StringList>()) {
        auto strings = current.get<Value::StringList>();
        if (value.isString()) {
            strings.push_back(value.get<std::string>());
            current = Value(std::move(strings));
        } else {
            // Promote to a generic sequence
            Value::List list(strings.begin(), strings.end());
            list.push_back(value.toScalar());
            current = Value(std::move(list));
        }
        return true;
    }
    if (current.holds<Value::List>()) {
        auto list = current.get<Value::List>();
        list.push_back(value.toScalar());
        current = Value(std::move(list));
        return true;
    }
    return false;
}

Query Bind::render(std::string_view query) const {
    std::shared_lock lock(mutex_);
    return Query{substitute(query, vars_), vars_};
}

std::string Bind::replace(std::string_view query) const {
    std::shared_lock lock(mutex_);
    return substitute(query, vars_);
}

NamedArgs Bind::snapshot() const {
    std::shared_lock lock(mutex_);
    return vars_;
}

std::size_t Bind::size() const {
    std::shared_lock lock(mutex_);
    return vars_.size();
}

nlohmann::json Bind::toJson() const {
    std::shared_lock lock(mutex_);
    auto out = nlohmann::json::object();
    for (const auto& [key, value] : vars_) {
        out[key] = value.toJson();
    }
    return out;
}

std::string Bind::str() const {
    return toJson().dump(2);
}

} // namespace pgbind
