#pragma once

#include "memory/insight.hpp"
#include "research/errors.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// MemoryStore - append-only insight storage.
//
// Every mutation appends the full new state of one insight (revision + 1) as a
// JSON line. Nothing is rewritten or deleted; on load the highest revision per
// insight id wins. Commits for the same id are serialized, and a commit based
// on a stale revision raises ConcurrentMutationConflict.
// ---------------------------------------------------------------------------
class MemoryStore {
public:
    MemoryStore() = default;

    explicit MemoryStore(const std::filesystem::path& log_path) : log_path_(log_path) {
        replay();
    }

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::optional<StrategyInsight> get(const std::string& insight_id) const {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto it = insights_.find(insight_id);
        if (it == insights_.end()) return std::nullopt;
        return it->second;
    }

    // Latest revision of every insight, ordered by id.
    std::vector<StrategyInsight> all() const {
        std::lock_guard<std::mutex> lock(map_mutex_);
        std::vector<StrategyInsight> out;
        for (const auto& [id, s] : insights_) out.push_back(s);
        return out;
    }

    int current_revision(const std::string& insight_id) const {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto it = insights_.find(insight_id);
        return it == insights_.end() ? 0 : it->second.revision;
    }

    // Append `next` as revision expected_revision + 1. Use 0 for a new insight.
    StrategyInsight commit(StrategyInsight next, int expected_revision) {
        std::lock_guard<std::mutex> id_lock(lock_for(next.insight_id));
        int current = current_revision(next.insight_id);
        if (current != expected_revision) {
            throw ConcurrentMutationConflict("insight " + next.insight_id + " is at revision "
                                             + std::to_string(current) + ", commit expected "
                                             + std::to_string(expected_revision));
        }
        next.revision = current + 1;
        append(next);
        std::lock_guard<std::mutex> lock(map_mutex_);
        insights_[next.insight_id] = next;
        return next;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(map_mutex_);
        return insights_.size();
    }

    size_t records_written() const {
        std::lock_guard<std::mutex> lock(log_mutex_);
        return records_;
    }

    const std::optional<std::filesystem::path>& log_path() const { return log_path_; }

private:
    std::mutex& lock_for(const std::string& insight_id) {
        std::lock_guard<std::mutex> lock(map_mutex_);
        auto& slot = id_locks_[insight_id];
        if (!slot) slot = std::make_unique<std::mutex>();
        return *slot;
    }

    void append(const StrategyInsight& s) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        ++records_;
        if (!log_path_) return;
        nlohmann::json rec;
        rec["seq"] = records_;
        rec["event"] = "insight_revision";
        rec["insight"] = s;
        std::ofstream out(*log_path_, std::ios::app);
        if (!out) {
            --records_;
            throw std::runtime_error("cannot append to memory log " + log_path_->string());
        }
        out << rec.dump() << "\n";
        out.flush();
        if (!out) {
            throw std::runtime_error("failed writing memory log " + log_path_->string());
        }
    }

    // Rebuild state from the log. A torn final record (interrupted append) is
    // cut off so the next append starts on a clean line; corruption anywhere
    // else is an error.
    void replay() {
        if (!log_path_ || !std::filesystem::exists(*log_path_)) return;
        std::string content;
        {
            std::ifstream in(*log_path_, std::ios::binary);
            if (!in) throw std::runtime_error("cannot read memory log " + log_path_->string());
            content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        size_t pos = 0;
        size_t line_no = 0;
        while (pos < content.size()) {
            size_t nl = content.find('\n', pos);
            size_t end = nl == std::string::npos ? content.size() : nl;
            size_t next = nl == std::string::npos ? content.size() : nl + 1;
            ++line_no;
            if (end == pos) {
                pos = next;
                continue;
            }
            StrategyInsight s;
            try {
                auto rec = nlohmann::json::parse(content.begin() + pos, content.begin() + end);
                s = rec.at("insight").get<StrategyInsight>();
            } catch (const nlohmann::json::exception& e) {
                if (content.find_first_not_of('\n', next) != std::string::npos) {
                    throw std::runtime_error("corrupt memory log " + log_path_->string() + " line "
                                             + std::to_string(line_no) + ": " + e.what());
                }
                std::filesystem::resize_file(*log_path_, pos);
                return;
            }
            if (nl == std::string::npos) {
                // Complete record without its newline: terminate it before appending.
                std::ofstream out(*log_path_, std::ios::app | std::ios::binary);
                out << "\n";
                if (!out) throw std::runtime_error("cannot repair memory log " + log_path_->string());
            }
            ++records_;
            auto it = insights_.find(s.insight_id);
            if (it == insights_.end() || it->second.revision < s.revision) {
                insights_[s.insight_id] = s;
            }
            pos = next;
        }
    }

    std::optional<std::filesystem::path> log_path_;
    mutable std::mutex map_mutex_;
    mutable std::mutex log_mutex_;
    std::map<std::string, StrategyInsight> insights_;
    std::map<std::string, std::unique_ptr<std::mutex>> id_locks_;
    size_t records_ = 0;
};
