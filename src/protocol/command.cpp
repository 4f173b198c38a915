#include "bitsd/protocol/command.hpp"
#include "bitsd/protocol/headers.hpp"

namespace bitsd::protocol {

namespace {

struct PacketNameVisitor {
    const char* operator()(const CreateSession&) const { return kPacketCreateSession; }
    const char* operator()(const Fragment&) const { return kPacketFragment; }
    const char* operator()(const CloseSession&) const { return kPacketCloseSession; }
    const char* operator()(const CancelSession&) const { return kPacketCancelSession; }
    const char* operator()(const Ping&) const { return kPacketPing; }
    const char* operator()(const Malformed&) const { return "Malformed"; }
};

} // namespace

const char* packet_name(const Command& command) {
    return std::visit(PacketNameVisitor{}, command);
}

} // namespace bitsd::protocol
