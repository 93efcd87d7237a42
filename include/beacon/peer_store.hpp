#pragma once
/**
 * @file peer_store.hpp
 * @brief Persistent record of peers met and what happened with them.
 *
 * @details
 * PURPOSE
 * -------
 * The live peer map forgets a device the moment it drops out of radio range.
 * After an incident, responders want to know who was nearby and when. The
 * store keeps the last known record of every peer ever seen plus a rolling
 * activity log (joined / left / message).
 *
 * JSON FILES (under data_dir(), human-readable on purpose)
 * --------------------------------------------------------
 *   peers.json     {"<peerId>": {"name","status","signal","lastSeen","emergency"}, ...}
 *   activity.json  [{"peerId","event","details","timestamp"}, ...]   oldest first,
 *                  capped at MAX_ACTIVITY records
 *
 * Each mutation rewrites the affected file atomically (tmp + rename).
 * A corrupt file is logged and treated as empty; it is replaced on the next
 * successful write.
 */

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "beacon/peer.hpp"

namespace beacon {

struct ActivityRecord {
    std::string peer_id;
    std::string event;        ///< "joined" | "left" | "message" | "connected" | "disconnected"
    std::string details;
    uint64_t    timestamp_ms{0};
};

/**
 * @brief Store trait. Implementations must not throw.
 */
class IPeerStore {
public:
    virtual ~IPeerStore() = default;
    virtual bool save_peer(const Peer& peer) = 0;
    virtual std::vector<Peer> load_peers() const = 0;
    virtual bool remove_peer(const std::string& peer_id) = 0;
    virtual bool log_activity(const ActivityRecord& rec) = 0;
    /// Newest first, at most @p limit records.
    virtual std::vector<ActivityRecord> load_recent_activity(size_t limit) const = 0;
};

class JsonPeerStore : public IPeerStore {
public:
    static constexpr size_t MAX_ACTIVITY = 500;

    /// @param dir  Directory holding peers.json and activity.json (created on first write).
    explicit JsonPeerStore(std::filesystem::path dir);

    /// Load both files. Missing files are not an error; corrupt ones are logged.
    void open();

    bool save_peer(const Peer& peer) override;
    std::vector<Peer> load_peers() const override;
    bool remove_peer(const std::string& peer_id) override;
    bool log_activity(const ActivityRecord& rec) override;
    std::vector<ActivityRecord> load_recent_activity(size_t limit) const override;

    const std::filesystem::path& dir() const { return dir_; }

private:
    bool write_peers() const;
    bool write_activity() const;

    std::filesystem::path dir_;
    std::map<std::string, Peer> peers_;
    std::vector<ActivityRecord> activity_;   ///< Oldest first.
};

} // namespace beacon
