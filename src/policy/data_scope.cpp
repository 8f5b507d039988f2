#include "policy/data_scope.hpp"

#include <algorithm>

namespace rulegate {

namespace {

std::string quote_literal(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted += '\'';
    for (const char c : value) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

const char* kind_to_string(DataScopePredicate::Kind kind) {
    switch (kind) {
        case DataScopePredicate::Kind::ALL:    return "all";
        case DataScopePredicate::Kind::NONE:   return "none";
        case DataScopePredicate::Kind::IN_SET: return "in_set";
    }
    return "none";
}

} // anonymous namespace

bool DataScopePredicate::admits(const std::string& id) const {
    switch (kind) {
        case Kind::ALL:    return true;
        case Kind::NONE:   return false;
        case Kind::IN_SET: return std::find(ids.begin(), ids.end(), id) != ids.end();
    }
    return false;
}

std::string DataScopePredicate::to_sql() const {
    if (kind == Kind::ALL) return "1 = 1";
    if (kind == Kind::NONE || ids.empty()) return "1 = 0";

    std::string sql = entity.empty() ? column : entity + "." + column;
    sql += " IN (";
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) sql += ", ";
        sql += quote_literal(ids[i]);
    }
    sql += ")";
    return sql;
}

nlohmann::json DataScopePredicate::to_json() const {
    nlohmann::json j;
    j["kind"] = kind_to_string(kind);
    j["entity"] = entity;
    j["column"] = column;
    j["ids"] = ids;
    j["sql"] = to_sql();
    return j;
}

} // namespace rulegate
