/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer for bring-up.
 */
#include "beacon/obs/observability.hpp"
#include <mutex>
#include <cstdio>
#include <string>

namespace beacon::obs {

    namespace {

    void append_json_escaped(std::string& out, const std::string& s) {
        for (unsigned char c : s) {
            switch (c) {
                case '"':  out += "\\\""; break;
                case '\\': out += "\\\\"; break;
                case '\n': out += "\\n"; break;
                case '\r': out += "\\r"; break;
                case '\t': out += "\\t"; break;
                default:
                    if (c < 0x20) {
                        char buf[8];
                        std::snprintf(buf, sizeof buf, "\\u%04x", static_cast<unsigned>(c));
                        out += buf;
                    } else {
                        out += static_cast<char>(c);
                    }
            }
        }
    }

    } // namespace

    const char* to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::Started:         return "started";
            case EventKind::Completed:       return "completed";
            case EventKind::SkippedInternal: return "skipped_internal";
            case EventKind::OrphanCallback:  return "orphan_callback";
            case EventKind::Injected:        return "injected";
        }
        return "unknown";
    }

    std::string to_json_line(const InterceptionEvent& e) {
        std::string line = R"({"event":")";
        line += to_string(e.kind);
        line += R"(","task":)";
        line += std::to_string(e.task_id);
        line += R"(,"url":")";
        append_json_escaped(line, e.url);
        line += R"(","first_party":)";
        line += e.first_party ? "true" : "false";
        line += R"(,"span":)";
        line += e.has_span_context ? "true" : "false";
        line += '}';
        return line;
    }

    class SimpleObserver : public Observer {
    public:
        void record(const InterceptionEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            switch (e.kind) {
                case EventKind::Started:         ctr_.started++;          break;
                case EventKind::Completed:       ctr_.completed++;        break;
                case EventKind::SkippedInternal: ctr_.skipped_internal++; break;
                case EventKind::OrphanCallback:  ctr_.orphan_callbacks++; break;
                case EventKind::Injected:        ctr_.injected++;         break;
            }
            // One JSON object per line (swap for structured logger later)
            std::printf("%s\n", to_json_line(e).c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace beacon::obs
