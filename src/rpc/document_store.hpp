// SPDX-License-Identifier: Apache-2.0
// document_store.hpp
// Thread-safe in-memory document database with per-path change listeners.
// Backs the in-process transport and the document emulator server.
#pragma once

#include "bridge/bridge_event.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace firetick::rpc {

class DocumentStore
{
public:
    struct Change
    {
        std::string path;
        std::optional<Document> document;
        uint64_t version{0};
    };
    // Invoked with the store lock held; must not call back into the store.
    using Listener = std::function<void(const Change &)>;

    std::optional<Document> get(const std::string &path) const;

    // Replaces the document, stamps name and version, notifies listeners.
    Document set(const std::string &path, Document doc, const std::string &name);

    // Returns false when nothing was stored. Notifies listeners either way.
    bool del(const std::string &path);

    // Registers `fn` and immediately hands it the current state of `path`
    // (version 0 when never written), so no change can precede the snapshot.
    uint64_t subscribe(const std::string &path, Listener fn);
    void unsubscribe(uint64_t id);

    size_t size() const;
    size_t listeners() const;

private:
    struct Slot
    {
        std::optional<Document> doc;
        uint64_t version{0};
    };
    struct Sub
    {
        std::string path;
        Listener fn;
    };

    void notify_locked(const std::string &path, const Slot &slot);

    mutable std::mutex m_mutex;
    std::map<std::string, Slot> m_docs;
    std::map<uint64_t, Sub> m_subs;
    uint64_t m_next_sub{1};
};

} // namespace firetick::rpc
