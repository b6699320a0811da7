/**
 * @file path_tracker.hpp
 * @brief Field path bookkeeping used by the decoder for error reports.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace packgraph {

    /**
     * @class PathTracker
     * @brief Stack of path segments rendered as "$.items[2].name".
     */
    class PathTracker {
    public:
        /**
         * @class Scope
         * @brief Pushes a segment for the lifetime of the object.
         */
        class Scope {
        public:
            Scope(PathTracker& t, std::string segment) : t_(t) { t_.segments_.push_back(std::move(segment)); }
            ~Scope() { t_.segments_.pop_back(); }
            Scope(const Scope&) = delete;
            Scope& operator=(const Scope&) = delete;
        private:
            PathTracker& t_;
        };

        Scope field(std::string_view name) { return Scope(*this, "." + std::string(name)); }
        Scope index(size_t i) { return Scope(*this, "[" + std::to_string(i) + "]"); }
        Scope segment(std::string raw) { return Scope(*this, std::move(raw)); }

        std::string str() const {
            std::string out = "$";
            for (const auto& s : segments_) out += s;
            return out;
        }

        size_t depth() const { return segments_.size(); }

    private:
        std::vector<std::string> segments_;
    };

}
