#ifndef MESH_PACKET_HPP
#define MESH_PACKET_HPP

#include <cstdint>
#include <string>

namespace MeshBridge {
namespace Link {

enum class LinkId {
    LINK_A,
    LINK_B
};

inline LinkId opposite_link(LinkId link_id) {
    return link_id == LinkId::LINK_A ? LinkId::LINK_B : LinkId::LINK_A;
}

inline const char* link_id_to_string(LinkId link_id) {
    return link_id == LinkId::LINK_A ? "A" : "B";
}

inline std::size_t link_index(LinkId link_id) {
    return link_id == LinkId::LINK_A ? 0 : 1;
}

constexpr const char* TEXT_MESSAGE_PORTNUM = "TEXT_MESSAGE_APP";
constexpr const char* BROADCAST_ADDRESS = "^all";

/**
 * One application-level message as delivered by a radio.
 * `id` is the opaque mesh packet id; empty means the radio did not supply one.
 */
struct MeshPacket {
    std::string id;
    std::string from_id;
    std::string to_id;
    std::string text;
    int channel = 0;
    std::string portnum = TEXT_MESSAGE_PORTNUM;

    bool is_text_message() const { return portnum == TEXT_MESSAGE_PORTNUM; }
};

// Cached device identity, as reported by the radio after connect
struct LinkIdentity {
    std::string node_id;
    uint32_t node_num = 0;
    std::string hw_model;

    bool is_known() const { return !node_id.empty(); }
};

} // namespace Link
} // namespace MeshBridge

#endif // MESH_PACKET_HPP
