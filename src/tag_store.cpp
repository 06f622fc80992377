#include "tag_store.hpp"

#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "errors.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;
using std::string;

TagStore::TagStore(string path) : path_(std::move(path)) {}

void TagStore::load() {
    tags_.clear();
    if (!fs::exists(path_)) return;

    std::ifstream in(path_);
    if (!in.is_open()) {
        spdlog::warn("tags: cannot read {}", path_);
        return;
    }
    json j = json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("tags: {} is not a JSON object, ignoring it", path_);
        return;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!it.value().is_string()) {
            spdlog::warn("tags: non-string tag for {} ignored", it.key());
            continue;
        }
        tags_[it.key()] = it.value().get<string>();
    }
    spdlog::debug("tags: loaded {} entries from {}", tags_.size(), path_);
}

void TagStore::save() const {
    json j = json::object();
    for (const auto& [id, tag] : tags_) j[id] = tag;

    const fs::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);

    string body;
    try {
        body = j.dump(2);
    } catch (const json::exception& e) {
        throw IoFailure("cannot encode tag file " + path_ + ": " + e.what());
    }

    const string tmp = path_ + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) throw IoFailure("cannot write tag file " + tmp);
        out << body << "\n";
        out.flush();
        if (!out) throw IoFailure("failed writing tag file " + tmp);
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        string reason = ec.message();
        fs::remove(tmp, ec);
        throw IoFailure("cannot replace tag file " + path_ + ": " + reason);
    }
}

std::optional<string> TagStore::get(const string& id) const {
    auto it = tags_.find(id);
    if (it == tags_.end()) return std::nullopt;
    return it->second;
}

std::optional<string> TagStore::find_by_tag(const string& tag) const {
    for (const auto& [id, value] : tags_)
        if (value == tag) return id;
    return std::nullopt;
}

void TagStore::set(const string& id, const string& tag) {
    auto previous = get(id);
    tags_[id] = tag;
    try {
        save();
    } catch (const IoFailure&) {
        if (previous) tags_[id] = *previous;
        else tags_.erase(id);
        throw;
    }
}

bool TagStore::erase(const string& id) {
    auto it = tags_.find(id);
    if (it == tags_.end()) return false;
    string previous = it->second;
    tags_.erase(it);
    try {
        save();
    } catch (const IoFailure&) {
        tags_[id] = previous;
        throw;
    }
    return true;
}
