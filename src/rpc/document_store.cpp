// SPDX-License-Identifier: Apache-2.0
#include "rpc/document_store.hpp"

namespace firetick::rpc {

std::optional<Document> DocumentStore::get(const std::string &path) const
{
    std::scoped_lock lk(m_mutex);
    auto it = m_docs.find(path);
    if (it == m_docs.end())
        return std::nullopt;
    return it->second.doc;
}

Document DocumentStore::set(const std::string &path, Document doc, const std::string &name)
{
    std::scoped_lock lk(m_mutex);
    auto &slot = m_docs[path];
    ++slot.version;
    doc.set_name(name);
    doc.set_version(slot.version);
    slot.doc = doc;
    notify_locked(path, slot);
    return doc;
}

bool DocumentStore::del(const std::string &path)
{
    std::scoped_lock lk(m_mutex);
    auto &slot = m_docs[path];
    bool existed = slot.doc.has_value();
    ++slot.version;
    slot.doc.reset();
    notify_locked(path, slot);
    return existed;
}

uint64_t DocumentStore::subscribe(const std::string &path, Listener fn)
{
    std::scoped_lock lk(m_mutex);
    Change initial{path, std::nullopt, 0};
    auto it = m_docs.find(path);
    if (it != m_docs.end()) {
        initial.document = it->second.doc;
        initial.version = it->second.version;
    }
    fn(initial);
    uint64_t id = m_next_sub++;
    m_subs.emplace(id, Sub{path, std::move(fn)});
    return id;
}

void DocumentStore::unsubscribe(uint64_t id)
{
    std::scoped_lock lk(m_mutex);
    m_subs.erase(id);
}

size_t DocumentStore::size() const
{
    std::scoped_lock lk(m_mutex);
    size_t n = 0;
    for (const auto &[path, slot] : m_docs) {
        if (slot.doc)
            ++n;
    }
    return n;
}

size_t DocumentStore::listeners() const
{
    std::scoped_lock lk(m_mutex);
    return m_subs.size();
}

void DocumentStore::notify_locked(const std::string &path, const Slot &slot)
{
    Change c{path, slot.doc, slot.version};
    for (auto &[id, sub] : m_subs) {
        if (sub.path == path)
            sub.fn(c);
    }
}

} // namespace firetick::rpc
