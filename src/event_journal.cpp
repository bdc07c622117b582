#include "event_journal.hpp"

#include "encoding.hpp"

#include <sstream>

namespace cl {

const char* eventKindName(EventKind kind) {
    switch (kind) {
    case EventKind::OwnershipTransferred:
        return "OwnershipTransferred";
    case EventKind::ProviderAdded:
        return "ProviderAdded";
    case EventKind::ProviderRemoved:
        return "ProviderRemoved";
    case EventKind::PauseToggled:
        return "PauseToggled";
    case EventKind::CooldownChanged:
        return "CooldownChanged";
    case EventKind::BatchOpened:
        return "BatchOpened";
    case EventKind::BatchClosed:
        return "BatchClosed";
    case EventKind::ParamsSubmitted:
        return "ParamsSubmitted";
    case EventKind::DecryptionRequested:
        return "DecryptionRequested";
    case EventKind::DecryptionCompleted:
        return "DecryptionCompleted";
    }
    return "Unknown";
}

Event& Event::with(std::string key, std::string value) {
    fields.emplace_back(std::move(key), std::move(value));
    return *this;
}

std::string Event::field(const std::string& key) const {
    for (const auto& [name, value] : fields) {
        if (name == key) {
            return value;
        }
    }
    return {};
}

void EventJournal::subscribe(EventListener listener) {
    if (listener) {
        listeners_.push_back(std::move(listener));
    }
}

void EventJournal::emit(Event event) {
    leaves_.push_back(leafHash(event));
    events_.push_back(std::move(event));
    const Event& stored = events_.back();
    // Copy: a listener may subscribe another listener while being notified.
    auto listeners = listeners_;
    for (const auto& listener : listeners) {
        listener(stored);
    }
}

std::vector<Event> EventJournal::eventsOfKind(EventKind kind) const {
    std::vector<Event> out;
    for (const auto& event : events_) {
        if (event.kind == kind) {
            out.push_back(event);
        }
    }
    return out;
}

std::string EventJournal::getLeaf(std::size_t index) const {
    if (index >= leaves_.size()) {
        return {};
    }
    return leaves_[index];
}

std::string EventJournal::canonicalize(const Event& event) {
    std::ostringstream oss;
    oss << "event:";
    appendLengthPrefixed(oss, eventKindName(event.kind));
    oss << "ts:" << event.timestamp << ';';
    for (const auto& [key, value] : event.fields) {
        appendLengthPrefixed(oss, key);
        appendLengthPrefixed(oss, value);
    }
    return oss.str();
}

std::string EventJournal::leafHash(const Event& event) {
    return sha256Hex(canonicalize(event));
}

std::string EventJournal::hashPair(const std::string& left, const std::string& right) {
    return sha256Hex(left + right);
}

std::string EventJournal::merkleRoot() const {
    if (leaves_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leaves_;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<std::string> EventJournal::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= leaves_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leaves_;
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::size_t siblingIndex = (index % 2 == 0) ? index + 1 : index - 1;
        if (siblingIndex >= layer.size()) {
            siblingIndex = index;
        }
        proof.push_back(layer[siblingIndex]);

        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
        index /= 2;
    }
    return proof;
}

bool EventJournal::verifyProof(const std::string& leaf,
                               std::size_t leafIndex,
                               std::size_t leafCount,
                               const std::vector<std::string>& proof,
                               const std::string& root) {
    if (leaf.empty() || root.empty() || leafIndex >= leafCount) {
        return false;
    }
    std::string current = leaf;
    std::size_t index = leafIndex;
    std::size_t layerSize = leafCount;
    std::size_t level = 0;
    while (layerSize > 1) {
        if (level >= proof.size()) {
            return false;
        }
        const std::string& sibling = proof[level];
        if (index % 2 == 1) {
            // A right child equal to its left neighbour is the duplicated last node, not a leaf.
            if (sibling == current) {
                return false;
            }
            current = hashPair(sibling, current);
        } else if (index + 1 < layerSize) {
            current = hashPair(current, sibling);
        } else {
            // Unpaired last node of an odd layer is hashed with itself.
            if (sibling != current) {
                return false;
            }
            current = hashPair(current, current);
        }
        index /= 2;
        layerSize = (layerSize + 1) / 2;
        ++level;
    }
    return level == proof.size() && current == root;
}

} // namespace cl
