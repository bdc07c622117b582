#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace cl {

enum class EventKind {
    OwnershipTransferred,
    ProviderAdded,
    ProviderRemoved,
    PauseToggled,
    CooldownChanged,
    BatchOpened,
    BatchClosed,
    ParamsSubmitted,
    DecryptionRequested,
    DecryptionCompleted
};

const char* eventKindName(EventKind kind);

struct Event {
    EventKind kind = EventKind::BatchOpened;
    std::uint64_t timestamp = 0;
    // Ordered; the order is part of the journal leaf.
    std::vector<std::pair<std::string, std::string>> fields;

    Event& with(std::string key, std::string value);
    std::string field(const std::string& key) const;
};

using EventListener = std::function<void(const Event&)>;

// Append-only record of every notification the pool emits. Each event is canonicalised and
// hashed into a leaf so indexers can check inclusion against a published Merkle root.
// Listeners run synchronously, after the state change that produced the event is committed.
class EventJournal {
public:
    void subscribe(EventListener listener);
    void emit(Event event);

    const std::vector<Event>& events() const { return events_; }
    std::vector<Event> eventsOfKind(EventKind kind) const;
    std::string getLeaf(std::size_t index) const;
    const std::vector<std::string>& getLeaves() const { return leaves_; }
    std::size_t size() const { return leaves_.size(); }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;

    static std::string canonicalize(const Event& event);
    static std::string leafHash(const Event& event);
    // leafCount is the journal size the root was taken at; positions outside it never verify.
    static bool verifyProof(const std::string& leaf,
                            std::size_t leafIndex,
                            std::size_t leafCount,
                            const std::vector<std::string>& proof,
                            const std::string& root);

private:
    static std::string hashPair(const std::string& left, const std::string& right);

    std::vector<Event> events_;
    std::vector<std::string> leaves_;
    std::vector<EventListener> listeners_;
};

} // namespace cl
