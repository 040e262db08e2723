// SPDX-License-Identifier: Apache-2.0
// Length-prefixed framing for the document wire protocol:
// [u32 big-endian payload length][payload bytes].
#pragma once
#include <arpa/inet.h>

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace firetick::netutil {

inline constexpr uint32_t k_max_frame_bytes = 16u * 1024u * 1024u;

inline std::string build_frame(const std::string &payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    std::string frame;
    frame.resize(4 + payload.size());
    std::memcpy(frame.data(), &net, 4);
    std::memcpy(frame.data() + 4, payload.data(), payload.size());
    return frame;
}

// Appends a frame to an existing outbound batch without an intermediate copy.
inline void append_frame(std::string &batch, const std::string &payload)
{
    uint32_t net = htonl(static_cast<uint32_t>(payload.size()));
    size_t offset = batch.size();
    batch.resize(offset + 4 + payload.size());
    std::memcpy(batch.data() + offset, &net, 4);
    std::memcpy(batch.data() + offset + 4, payload.data(), payload.size());
}

struct FrameParseState
{
    std::vector<char> buffer; // accumulated bytes
    uint32_t expected_len{0};
    bool have_len{false};
    bool corrupt{false}; // set once an invalid length is seen; connection must be dropped
};

// Extracts one complete payload into out. Returns false when more bytes are
// needed or the stream is corrupt (check st.corrupt).
inline bool try_extract(FrameParseState &st, std::string &out)
{
    if (st.corrupt)
        return false;
    if (!st.have_len) {
        if (st.buffer.size() < 4)
            return false;
        uint32_t net;
        std::memcpy(&net, st.buffer.data(), 4);
        st.expected_len = ntohl(net);
        if (st.expected_len == 0 || st.expected_len > k_max_frame_bytes) {
            st.corrupt = true;
            return false;
        }
        st.have_len = true;
    }
    if (st.buffer.size() < 4 + static_cast<size_t>(st.expected_len))
        return false;
    out.assign(st.buffer.data() + 4, st.expected_len);
    st.buffer.erase(st.buffer.begin(), st.buffer.begin() + 4 + st.expected_len);
    st.have_len = false;
    st.expected_len = 0;
    return true;
}

} // namespace firetick::netutil
