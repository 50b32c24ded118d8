#include "LocalEngine.hpp"
#include "TextExtractor.hpp"
#include "Version.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <set>

namespace strata_mcp {

namespace fs = std::filesystem;

namespace {

uint64_t now_micros() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(now).count());
}

std::map<std::string, int> trigrams(const std::string& text) {
    std::map<std::string, int> grams;
    for (const auto& term : TextExtractor::tokenize(text)) {
        std::string padded = " " + term + " ";
        for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
            grams[padded.substr(i, 3)]++;
        }
    }
    return grams;
}

double cosine(const std::map<std::string, int>& a, const std::map<std::string, int>& b) {
    if (a.empty() || b.empty()) {
        return 0.0;
    }
    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (const auto& [gram, count] : a) {
        norm_a += static_cast<double>(count) * count;
        auto it = b.find(gram);
        if (it != b.end()) {
            dot += static_cast<double>(count) * it->second;
        }
    }
    for (const auto& [gram, count] : b) {
        norm_b += static_cast<double>(count) * count;
    }
    return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

// Similarity below this is treated as noise
constexpr double kSemanticThreshold = 0.2;

constexpr double kBm25K1 = 1.2;
constexpr double kBm25B = 0.75;

} // namespace

std::optional<std::string> LocalEngine::take_index(Branch& branch, const std::string& ns,
                                                   const std::string& key) {
    auto space_index = branch.indexed.find(ns);
    if (space_index == branch.indexed.end()) {
        return std::nullopt;
    }
    auto entry = space_index->second.find(key);
    if (entry == space_index->second.end()) {
        return std::nullopt;
    }
    std::string text = std::move(entry->second);
    space_index->second.erase(entry);
    return text;
}

void LocalEngine::restore_index(Branch& branch, const std::string& ns, const std::string& key,
                                std::optional<std::string> text) {
    if (text) {
        branch.indexed[ns][key] = std::move(*text);
    }
}

void LocalEngine::drop_last_version(Branch& branch, const std::string& ns, const std::string& key) {
    Space& space = branch.spaces[ns];
    Chain& chain = space[key];
    if (!chain.empty()) {
        chain.pop_back();
    }
    if (chain.empty()) {
        space.erase(key);
    }
    if (space.empty()) {
        branch.spaces.erase(ns);
    }
}

LocalEngine::LocalEngine(EngineOptions options)
    : options_(std::move(options)), opened_at_(std::chrono::steady_clock::now()) {
    load();

    if (branches_.find(kDefaultBranch) == branches_.end()) {
        Branch root;
        root.created_at = next_timestamp();
        branches_.emplace(kDefaultBranch, std::move(root));
    }

    spdlog::info("LocalEngine opened ({}, {}, {} branches)",
                 options_.data_dir ? options_.data_dir->string() : "memory only",
                 options_.read_only ? "read-only" : "read-write",
                 branches_.size());
}

WriteReceipt LocalEngine::put(const std::string& branch, const std::string& ns,
                              const std::string& key, const json& value,
                              const std::vector<std::string>& tags) {
    require_writable("put");
    std::lock_guard<std::mutex> lock(mutex_);

    Branch& b = branch_ref(branch);
    Version v;
    v.value = value;
    v.tags = tags;
    v.version = ++version_counter_;
    v.timestamp = next_timestamp();
    b.spaces[ns][key].push_back(v);

    // The previous index entry describes a stale value
    std::optional<std::string> stale_index = take_index(b, ns, key);

    commit([&] {
        drop_last_version(b, ns, key);
        restore_index(b, ns, key, std::move(stale_index));
    });
    return {v.version, v.timestamp};
}

std::optional<VersionedValue> LocalEngine::get(const std::string& branch, const std::string& ns,
                                               const std::string& key,
                                               std::optional<uint64_t> as_of) {
    std::lock_guard<std::mutex> lock(mutex_);

    Branch& b = branch_ref(branch);
    auto space_it = b.spaces.find(ns);
    if (space_it == b.spaces.end()) {
        return std::nullopt;
    }
    auto chain_it = space_it->second.find(key);
    if (chain_it == space_it->second.end() || chain_it->second.empty()) {
        return std::nullopt;
    }

    const Chain& chain = chain_it->second;
    const Version* found = nullptr;
    if (as_of) {
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            if (it->timestamp <= *as_of) {
                found = &*it;
                break;
            }
        }
    } else {
        found = &chain.back();
    }

    if (!found || found->deleted) {
        return std::nullopt;
    }
    return VersionedValue{found->value, found->tags, found->version, found->timestamp};
}

bool LocalEngine::remove(const std::string& branch, const std::string& ns, const std::string& key) {
    require_writable("delete");
    std::lock_guard<std::mutex> lock(mutex_);

    Branch& b = branch_ref(branch);
    auto space_it = b.spaces.find(ns);
    if (space_it == b.spaces.end()) {
        return false;
    }
    auto chain_it = space_it->second.find(key);
    if (chain_it == space_it->second.end() || !is_live(chain_it->second)) {
        return false;
    }

    Version tombstone;
    tombstone.version = ++version_counter_;
    tombstone.timestamp = next_timestamp();
    tombstone.deleted = true;
    chain_it->second.push_back(std::move(tombstone));
    std::optional<std::string> stale_index = take_index(b, ns, key);

    commit([&] {
        drop_last_version(b, ns, key);
        restore_index(b, ns, key, std::move(stale_index));
    });
    return true;
}

EventReceipt LocalEngine::append_event(const std::string& branch, const std::string& event_type,
                                       const json& payload) {
    require_writable("append_event");
    std::lock_guard<std::mutex> lock(mutex_);

    Branch& b = branch_ref(branch);
    Event e;
    e.sequence = b.events.empty() ? 1 : b.events.back().sequence + 1;
    e.timestamp = next_timestamp();
    e.type = event_type;
    e.payload = payload;
    b.events.push_back(e);

    commit([&b] { b.events.pop_back(); });
    return {e.sequence, e.timestamp};
}

std::vector<SearchHit> LocalEngine::search(const std::string& branch, const std::string& ns,
                                           const std::string& query, std::size_t k,
                                           const std::vector<std::string>& tags) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Branch& b = branch_ref(branch);
    auto terms = TextExtractor::tokenize(query);
    auto space_it = b.spaces.find(ns);
    if (terms.empty() || k == 0 || space_it == b.spaces.end()) {
        return {};
    }

    struct Document {
        const std::string* key;
        const Version* latest;
        std::string text;
        std::map<std::string, int> term_counts;
        std::size_t length = 0;
    };

    std::vector<Document> docs;
    for (const auto& [key, chain] : space_it->second) {
        if (!is_live(chain)) {
            continue;
        }
        const Version& latest = chain.back();
        bool tagged = std::all_of(tags.begin(), tags.end(), [&latest](const std::string& tag) {
            return std::find(latest.tags.begin(), latest.tags.end(), tag) != latest.tags.end();
        });
        if (!tagged) {
            continue;
        }

        Document doc{&key, &latest, key + " " + TextExtractor::extract(latest.value), {}, 0};
        for (const auto& token : TextExtractor::tokenize(doc.text)) {
            doc.term_counts[token]++;
            doc.length++;
        }
        docs.push_back(std::move(doc));
    }

    if (docs.empty()) {
        return {};
    }

    double avg_length = 0.0;
    for (const auto& doc : docs) {
        avg_length += static_cast<double>(doc.length);
    }
    avg_length = std::max(1.0, avg_length / static_cast<double>(docs.size()));

    std::map<std::string, double> idf;
    for (const auto& term : terms) {
        std::size_t df = 0;
        for (const auto& doc : docs) {
            if (doc.term_counts.count(term)) {
                df++;
            }
        }
        double n = static_cast<double>(docs.size());
        idf[term] = std::log(1.0 + (n - df + 0.5) / (df + 0.5));
    }

    auto query_grams = trigrams(query);
    auto index_it = b.indexed.find(ns);

    std::vector<SearchHit> hits;
    for (const auto& doc : docs) {
        double keyword = 0.0;
        for (const auto& term : terms) {
            auto tf_it = doc.term_counts.find(term);
            if (tf_it == doc.term_counts.end()) {
                continue;
            }
            double tf = tf_it->second;
            double norm = kBm25K1 * (1.0 - kBm25B + kBm25B * doc.length / avg_length);
            keyword += idf[term] * (tf * (kBm25K1 + 1.0)) / (tf + norm);
        }

        double semantic = 0.0;
        if (index_it != b.indexed.end()) {
            auto text_it = index_it->second.find(*doc.key);
            if (text_it != index_it->second.end()) {
                semantic = cosine(query_grams, trigrams(text_it->second));
                if (semantic < kSemanticThreshold) {
                    semantic = 0.0;
                }
            }
        }

        double score = keyword + semantic;
        if (score <= 0.0) {
            continue;
        }
        hits.push_back({*doc.key, doc.latest->value, score, TextExtractor::snippet(doc.text, terms)});
    }

    std::sort(hits.begin(), hits.end(), [](const SearchHit& a, const SearchHit& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        return a.key < b.key;
    });
    if (hits.size() > k) {
        hits.resize(k);
    }
    return hits;
}

void LocalEngine::index_for_search(const std::string& branch, const std::string& ns,
                                   const std::string& key, const std::string& text) {
    require_writable("index");
    std::lock_guard<std::mutex> lock(mutex_);

    Branch& b = branch_ref(branch);
    auto space_it = b.spaces.find(ns);
    if (space_it == b.spaces.end()) {
        throw EngineError(EngineErrc::KeyNotFound, "key not found: " + key);
    }
    auto chain_it = space_it->second.find(key);
    if (chain_it == space_it->second.end() || !is_live(chain_it->second)) {
        throw EngineError(EngineErrc::KeyNotFound, "key not found: " + key);
    }

    std::optional<std::string> previous = take_index(b, ns, key);
    b.indexed[ns][key] = text;
    commit([&] {
        b.indexed[ns].erase(key);
        restore_index(b, ns, key, std::move(previous));
    });
}

BranchInfo LocalEngine::branch_create(const std::optional<std::string>& name) {
    require_writable("branch_create");
    std::lock_guard<std::mutex> lock(mutex_);

    std::string branch_name;
    if (name) {
        if (name->empty()) {
            throw EngineError(EngineErrc::InvalidInput, "branch name cannot be empty");
        }
        if (branches_.count(*name)) {
            throw EngineError(EngineErrc::BranchExists, "branch already exists: " + *name);
        }
        branch_name = *name;
    } else {
        do {
            branch_name = "branch-" + std::to_string(++branch_counter_);
        } while (branches_.count(branch_name));
    }

    Branch fresh;
    fresh.created_at = next_timestamp();
    BranchInfo info{branch_name, std::nullopt, fresh.created_at, 0};
    branches_.emplace(branch_name, std::move(fresh));

    commit([&] { branches_.erase(branch_name); });
    return info;
}

bool LocalEngine::branch_exists(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return branches_.count(name) > 0;
}

ForkResult LocalEngine::branch_fork(const std::string& source, const std::string& destination) {
    require_writable("branch_fork");
    std::lock_guard<std::mutex> lock(mutex_);

    const Branch& src = branch_ref(source);
    if (destination.empty()) {
        throw EngineError(EngineErrc::InvalidInput, "branch name cannot be empty");
    }
    if (branches_.count(destination)) {
        throw EngineError(EngineErrc::BranchExists, "branch already exists: " + destination);
    }

    Branch copy = src;
    copy.parent = source;
    copy.created_at = next_timestamp();
    copy.forked_at = copy.created_at;
    std::size_t keys = live_key_count(copy);
    branches_.emplace(destination, std::move(copy));

    commit([&] { branches_.erase(destination); });
    return {source, destination, keys};
}

MergeResult LocalEngine::branch_merge(const std::string& source, const std::string& target) {
    require_writable("branch_merge");
    std::lock_guard<std::mutex> lock(mutex_);

    if (source == target) {
        throw EngineError(EngineErrc::InvalidInput, "cannot merge a branch into itself");
    }
    const Branch& src = branch_ref(source);
    Branch& dst = branch_ref(target);

    // Changes newer than the common fork point are the ones to apply
    uint64_t base = 0;
    if (src.parent && *src.parent == target) {
        base = src.forked_at;
    } else if (dst.parent && *dst.parent == source) {
        base = dst.forked_at;
    }

    MergeResult result;
    std::set<std::string> touched;
    Branch before = dst;

    for (const auto& [ns, space] : src.spaces) {
        for (const auto& [key, chain] : space) {
            if (chain.empty() || chain.back().timestamp <= base) {
                continue;
            }
            const Version& incoming = chain.back();

            Chain& existing = dst.spaces[ns][key];
            bool target_live = is_live(existing);
            if (incoming.deleted && !target_live) {
                continue;
            }
            if (!incoming.deleted && target_live && existing.back().value == incoming.value) {
                continue;
            }

            if (!existing.empty() && existing.back().timestamp > base) {
                result.conflicts.push_back({key, ns});
            }

            Version applied = incoming;
            applied.version = ++version_counter_;
            applied.timestamp = next_timestamp();
            existing.push_back(std::move(applied));

            auto src_index = src.indexed.find(ns);
            if (!incoming.deleted && src_index != src.indexed.end() && src_index->second.count(key)) {
                dst.indexed[ns][key] = src_index->second.at(key);
            } else if (dst.indexed.count(ns)) {
                dst.indexed[ns].erase(key);
            }

            result.keys_applied++;
            touched.insert(ns);
        }
    }

    // Drop empty chains created by lookups that applied nothing
    for (auto& [ns, space] : dst.spaces) {
        for (auto it = space.begin(); it != space.end();) {
            it = it->second.empty() ? space.erase(it) : std::next(it);
        }
    }

    result.namespaces_merged = touched.size();
    if (result.keys_applied > 0) {
        commit([&] { dst = std::move(before); });
    }
    return result;
}

DiffResult LocalEngine::branch_diff(const std::string& branch_a, const std::string& branch_b) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto a = live_values(branch_ref(branch_a));
    auto b = live_values(branch_ref(branch_b));

    DiffResult diff;
    diff.branch_a = branch_a;
    diff.branch_b = branch_b;

    auto label = [](const std::pair<std::string, std::string>& entry) {
        return entry.first + "/" + entry.second;
    };

    for (const auto& [entry, value] : a) {
        auto it = b.find(entry);
        if (it == b.end()) {
            diff.removed.push_back(label(entry));
        } else if (it->second != value) {
            diff.modified.push_back(label(entry));
        }
    }
    for (const auto& [entry, value] : b) {
        if (!a.count(entry)) {
            diff.added.push_back(label(entry));
        }
    }
    return diff;
}

void LocalEngine::branch_delete(const std::string& name) {
    require_writable("branch_delete");
    std::lock_guard<std::mutex> lock(mutex_);

    if (name == kDefaultBranch) {
        throw EngineError(EngineErrc::InvalidInput, "the default branch cannot be deleted");
    }
    auto it = branches_.find(name);
    if (it == branches_.end()) {
        throw EngineError(EngineErrc::BranchNotFound, "branch not found: " + name);
    }
    Branch removed = std::move(it->second);
    branches_.erase(it);
    commit([&] { branches_.emplace(name, std::move(removed)); });
}

std::vector<BranchInfo> LocalEngine::branch_list() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<BranchInfo> list;
    for (const auto& [name, b] : branches_) {
        list.push_back({name, b.parent, b.created_at, live_key_count(b)});
    }
    return list;
}

std::vector<VersionedValue> LocalEngine::history(const std::string& branch, const std::string& ns,
                                                 const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Branch& b = branch_ref(branch);
    std::vector<VersionedValue> versions;

    auto space_it = b.spaces.find(ns);
    if (space_it == b.spaces.end()) {
        return versions;
    }
    auto chain_it = space_it->second.find(key);
    if (chain_it == space_it->second.end()) {
        return versions;
    }

    for (const auto& v : chain_it->second) {
        if (!v.deleted) {
            versions.push_back({v.value, v.tags, v.version, v.timestamp});
        }
    }
    return versions;
}

TimeRange LocalEngine::time_range(const std::string& branch) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Branch& b = branch_ref(branch);
    TimeRange range;
    auto observe = [&range](uint64_t ts) {
        if (!range.oldest || ts < *range.oldest) {
            range.oldest = ts;
        }
        if (!range.latest || ts > *range.latest) {
            range.latest = ts;
        }
    };

    for (const auto& [ns, space] : b.spaces) {
        for (const auto& [key, chain] : space) {
            for (const auto& v : chain) {
                observe(v.timestamp);
            }
        }
    }
    for (const auto& e : b.events) {
        observe(e.timestamp);
    }
    return range;
}

EngineInfo LocalEngine::introspect() {
    std::lock_guard<std::mutex> lock(mutex_);

    EngineInfo info;
    info.version = kServerVersion;
    info.branch_count = branches_.size();
    for (const auto& [name, b] : branches_) {
        info.total_keys += live_key_count(b);
        info.total_events += b.events.size();
    }
    info.uptime_secs = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - opened_at_).count());
    return info;
}

LocalEngine::Branch& LocalEngine::branch_ref(const std::string& name) {
    auto it = branches_.find(name);
    if (it == branches_.end()) {
        throw EngineError(EngineErrc::BranchNotFound, "branch not found: " + name);
    }
    return it->second;
}

void LocalEngine::require_writable(const char* operation) const {
    if (options_.read_only) {
        throw EngineError(EngineErrc::ReadOnly,
                          std::string("access denied: ") + operation + " rejected, database is read-only");
    }
}

uint64_t LocalEngine::next_timestamp() {
    last_timestamp_ = std::max(now_micros(), last_timestamp_ + 1);
    return last_timestamp_;
}

bool LocalEngine::is_live(const Chain& chain) {
    return !chain.empty() && !chain.back().deleted;
}

std::size_t LocalEngine::live_key_count(const Branch& branch) {
    std::size_t count = 0;
    for (const auto& [ns, space] : branch.spaces) {
        for (const auto& [key, chain] : space) {
            if (is_live(chain)) {
                count++;
            }
        }
    }
    return count;
}

std::map<std::pair<std::string, std::string>, json> LocalEngine::live_values(const Branch& branch) const {
    std::map<std::pair<std::string, std::string>, json> values;
    for (const auto& [ns, space] : branch.spaces) {
        for (const auto& [key, chain] : space) {
            if (is_live(chain)) {
                values[{ns, key}] = chain.back().value;
            }
        }
    }
    return values;
}

// ── Persistence ──────────────────────────────────────────────────────────

void LocalEngine::load() {
    if (!options_.data_dir) {
        return;
    }

    const fs::path& dir = *options_.data_dir;
    std::error_code ec;
    if (!fs::exists(dir, ec)) {
        if (options_.read_only) {
            spdlog::warn("Data directory {} does not exist, starting empty", dir.string());
            return;
        }
        fs::create_directories(dir, ec);
        if (ec) {
            throw EngineError(EngineErrc::Io,
                              "cannot create data directory " + dir.string() + ": " + ec.message());
        }
        return;
    }

    fs::path file = dir / kSnapshotFile;
    if (!fs::exists(file, ec)) {
        return;
    }

    std::ifstream in(file);
    if (!in) {
        throw EngineError(EngineErrc::Io, "cannot open " + file.string());
    }

    try {
        restore(json::parse(in));
    } catch (const json::exception& e) {
        throw EngineError(EngineErrc::Io, "corrupt snapshot " + file.string() + ": " + e.what());
    }
    spdlog::debug("Loaded snapshot {}", file.string());
}

void LocalEngine::persist() {
    if (!options_.data_dir || options_.read_only) {
        return;
    }

    fs::path file = *options_.data_dir / kSnapshotFile;
    fs::path tmp = file;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw EngineError(EngineErrc::Io, "cannot write " + tmp.string());
        }
        out << snapshot().dump();
        if (!out) {
            throw EngineError(EngineErrc::Io, "short write to " + tmp.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec) {
        throw EngineError(EngineErrc::Io, "cannot replace " + file.string() + ": " + ec.message());
    }
}

void LocalEngine::commit(const std::function<void()>& rollback) {
    try {
        persist();
    } catch (...) {
        rollback();
        throw;
    }
}

json LocalEngine::snapshot() const {
    json branches = json::object();
    for (const auto& [name, b] : branches_) {
        json spaces = json::object();
        for (const auto& [ns, space] : b.spaces) {
            json keys = json::object();
            for (const auto& [key, chain] : space) {
                json versions = json::array();
                for (const auto& v : chain) {
                    versions.push_back({
                        {"value", v.value},
                        {"tags", v.tags},
                        {"version", v.version},
                        {"timestamp", v.timestamp},
                        {"deleted", v.deleted}
                    });
                }
                keys[key] = std::move(versions);
            }
            spaces[ns] = std::move(keys);
        }

        json events = json::array();
        for (const auto& e : b.events) {
            events.push_back({
                {"sequence", e.sequence},
                {"timestamp", e.timestamp},
                {"type", e.type},
                {"payload", e.payload}
            });
        }

        branches[name] = {
            {"parent", b.parent ? json(*b.parent) : json()},
            {"created_at", b.created_at},
            {"forked_at", b.forked_at},
            {"spaces", std::move(spaces)},
            {"events", std::move(events)},
            {"indexed", b.indexed}
        };
    }

    return {
        {"format", 1},
        {"version_counter", version_counter_},
        {"last_timestamp", last_timestamp_},
        {"branch_counter", branch_counter_},
        {"branches", std::move(branches)}
    };
}

void LocalEngine::restore(const json& state) {
    if (state.value("format", 0) != 1) {
        throw EngineError(EngineErrc::Io, "unsupported snapshot format");
    }

    version_counter_ = state.at("version_counter").get<uint64_t>();
    last_timestamp_ = state.at("last_timestamp").get<uint64_t>();
    branch_counter_ = state.value("branch_counter", uint64_t{0});
    branches_.clear();

    for (const auto& [name, jb] : state.at("branches").items()) {
        Branch b;
        if (jb.contains("parent") && jb["parent"].is_string()) {
            b.parent = jb["parent"].get<std::string>();
        }
        b.created_at = jb.at("created_at").get<uint64_t>();
        b.forked_at = jb.value("forked_at", uint64_t{0});

        for (const auto& [ns, jspace] : jb.at("spaces").items()) {
            for (const auto& [key, jchain] : jspace.items()) {
                Chain& chain = b.spaces[ns][key];
                for (const auto& jv : jchain) {
                    Version v;
                    v.value = jv.at("value");
                    v.tags = jv.value("tags", std::vector<std::string>{});
                    v.version = jv.at("version").get<uint64_t>();
                    v.timestamp = jv.at("timestamp").get<uint64_t>();
                    v.deleted = jv.value("deleted", false);
                    chain.push_back(std::move(v));
                }
            }
        }

        for (const auto& je : jb.at("events")) {
            b.events.push_back({
                je.at("sequence").get<uint64_t>(),
                je.at("timestamp").get<uint64_t>(),
                je.at("type").get<std::string>(),
                je.at("payload")
            });
        }

        if (jb.contains("indexed")) {
            b.indexed = jb["indexed"].get<std::map<std::string, std::map<std::string, std::string>>>();
        }
        branches_.emplace(name, std::move(b));
    }
}

} // namespace strata_mcp
