#include "graph/graph_store.hpp"
#include <algorithm>
#include <sstream>

using json = nlohmann::json;

namespace lore {

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::set<std::string> string_set(const json& j, const char* key) {
    std::set<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) out.insert(item.get<std::string>());
        }
    }
    return out;
}

} // anonymous namespace

// ==========================================
// NodeInfo
// ==========================================

std::string NodeInfo::to_text() const {
    std::ostringstream out;
    out << "=== " << title;
    if (!labels.empty()) {
        out << " [" << join(labels, ", ") << "]";
    }
    out << " ===\n";

    if (!description.empty()) {
        out << "Description: " << description << "\n";
    }

    if (!detailed) {
        return out.str();
    }

    if (!outgoing.empty()) {
        out << "\nOutgoing relations:\n";
        for (const auto& rel : outgoing) {
            out << "  - " << rel.type << ": " << rel.node << "\n";
        }
    }

    if (!incoming.empty()) {
        out << "\nIncoming relations:\n";
        for (const auto& rel : incoming) {
            out << "  - " << rel.type << ": " << rel.node << "\n";
        }
    }

    return out.str();
}

json NodeInfo::to_json() const {
    json j;
    j["title"] = title;
    j["labels"] = labels;
    j["text"] = description;
    j["source"] = source_url.has_value() ? json(*source_url) : json(nullptr);
    j["detailed"] = detailed;

    if (detailed) {
        json out = json::array();
        for (const auto& rel : outgoing) {
            out.push_back({{"type", rel.type}, {"target", rel.node}});
        }
        json in = json::array();
        for (const auto& rel : incoming) {
            in.push_back({{"type", rel.type}, {"source", rel.node}});
        }
        j["outgoing"] = out;
        j["incoming"] = in;
    }
    return j;
}

NodeInfo NodeInfo::from_json(const json& j) {
    NodeInfo info;
    info.title = j.at("title").get<std::string>();
    if (j.contains("labels") && j["labels"].is_array()) {
        info.labels = j["labels"].get<std::vector<std::string>>();
    }
    if (j.contains("text") && j["text"].is_string()) {
        info.description = j["text"].get<std::string>();
    }
    if (j.contains("source") && j["source"].is_string()) {
        info.source_url = j["source"].get<std::string>();
    }
    info.detailed = j.value("detailed", false);

    if (j.contains("outgoing")) {
        for (const auto& rel : j["outgoing"]) {
            info.outgoing.push_back({rel.at("type").get<std::string>(), rel.at("target").get<std::string>()});
        }
    }
    if (j.contains("incoming")) {
        for (const auto& rel : j["incoming"]) {
            info.incoming.push_back({rel.at("type").get<std::string>(), rel.at("source").get<std::string>()});
        }
    }
    return info;
}

// ==========================================
// GraphPath
// ==========================================

std::vector<std::string> GraphPath::interleaved() const {
    std::vector<std::string> sequence;
    for (size_t i = 0; i < nodes.size(); ++i) {
        sequence.push_back(nodes[i]);
        if (i < relations.size()) {
            sequence.push_back(relations[i]);
        }
    }
    return sequence;
}

std::vector<std::string> GraphPath::interior() const {
    if (nodes.size() <= 2) {
        return {};
    }
    return std::vector<std::string>(nodes.begin() + 1, nodes.end() - 1);
}

GraphPath GraphPath::reversed() const {
    GraphPath path;
    path.nodes.assign(nodes.rbegin(), nodes.rend());
    path.relations.assign(relations.rbegin(), relations.rend());
    return path;
}

// ==========================================
// PathConstraints
// ==========================================

PathConstraints PathConstraints::defaults() {
    PathConstraints constraints;
    constraints.excluded_relation_types = {
        "РАСА", "СТАТУС", "ССЫЛКА", "ПРЕДСТАВЛЯЕТ", "ПОТЕРИ", "ВОЙСКА",
        "ПОГИБ", "ДАТА", "СЕГМЕНТУМ", "СЕКТОР", "ЖАНР", "ПРЕДЫДУЩАЯ",
        "ИЗДАТЕЛЬ", "СЛЕДУЮЩАЯ", "ПРИНАДЛЕЖНОСТЬ", "ЯВЛЯЮТСЯ_НАСЛЕДНИКАМИ"
    };
    constraints.excluded_interior_labels = {"Персонажи_", "Организации_Империума"};
    constraints.excluded_titles = {"Неизвестно", "Неизвестен"};
    return constraints;
}

json PathConstraints::to_json() const {
    return {
        {"excluded_relation_types", excluded_relation_types},
        {"excluded_interior_labels", excluded_interior_labels},
        {"excluded_titles", excluded_titles}
    };
}

PathConstraints PathConstraints::from_json(const json& j) {
    PathConstraints constraints;
    constraints.excluded_relation_types = string_set(j, "excluded_relation_types");
    constraints.excluded_interior_labels = string_set(j, "excluded_interior_labels");
    constraints.excluded_titles = string_set(j, "excluded_titles");
    return constraints;
}

std::set<std::string> default_info_excluded_relations() {
    return {"ССЫЛКА", "ПРИНАДЛЕЖНОСТЬ", "УЧАСТНИК", "ПРЕДЫДУЩАЯ", "СЛЕДУЮЩАЯ"};
}

} // namespace lore
