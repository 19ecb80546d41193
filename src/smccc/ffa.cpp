#include "services.hpp"

#include <algorithm>
#include <iterator>

namespace esrdecoder::smccc {

namespace {

    struct FFAFunction {
        uint16_t id;
        const char *name;
    };

    // Function numbers of FF-A v1.1 calls, under the Standard Secure Service
    constexpr FFAFunction kFFA32Functions[] = {
        {0x60, "FFA_ERROR_32"},
        {0x61, "FFA_SUCCESS_32"},
        {0x62, "FFA_INTERRUPT_32"},
        {0x63, "FFA_VERSION_32"},
        {0x64, "FFA_FEATURES_32"},
        {0x65, "FFA_RX_RELEASE_32"},
        {0x66, "FFA_RXTX_MAP_32"},
        {0x67, "FFA_RXTX_UNMAP_32"},
        {0x68, "FFA_PARTITION_INFO_GET_32"},
        {0x69, "FFA_ID_GET_32"},
        {0x6A, "FFA_MSG_POLL_32"},
        {0x6B, "FFA_MSG_WAIT_32"},
        {0x6C, "FFA_YIELD_32"},
        {0x6D, "FFA_RUN_32"},
        {0x6E, "FFA_MSG_SEND_32"},
        {0x6F, "FFA_MSG_SEND_DIRECT_REQ_32"},
        {0x70, "FFA_MSG_SEND_DIRECT_RESP_32"},
        {0x71, "FFA_MEM_DONATE_32"},
        {0x72, "FFA_MEM_LEND_32"},
        {0x73, "FFA_MEM_SHARE_32"},
        {0x74, "FFA_MEM_RETRIEVE_REQ_32"},
        {0x75, "FFA_MEM_RETRIEVE_RESP_32"},
        {0x76, "FFA_MEM_RELINQUISH_32"},
        {0x77, "FFA_MEM_RECLAIM_32"},
        {0x78, "FFA_MEM_OP_PAUSE"},
        {0x79, "FFA_MEM_OP_RESUME"},
        {0x7A, "FFA_MEM_FRAG_RX_32"},
        {0x7B, "FFA_MEM_FRAG_TX_32"},
        {0x7C, "FFA_NORMAL_WORLD_RESUME"},
    };

    constexpr FFAFunction kFFA64Functions[] = {
        {0x66, "FFA_RXTX_MAP_64"},
        {0x6F, "FFA_MSG_SEND_DIRECT_REQ_64"},
        {0x70, "FFA_MSG_SEND_DIRECT_RESP_64"},
        {0x71, "FFA_MEM_DONATE_64"},
        {0x72, "FFA_MEM_LEND_64"},
        {0x73, "FFA_MEM_SHARE_64"},
        {0x74, "FFA_MEM_RETRIEVE_REQ_64"},
    };

    template <size_t N>
    std::optional<const char *> Lookup(const FFAFunction (&table)[N], uint64_t function) {
        auto it = std::find_if(std::begin(table), std::end(table),
                               [&](const FFAFunction &entry) { return entry.id == function; });
        if (it == std::end(table)) {
            return std::nullopt;
        }
        return it->name;
    }

} // namespace

std::optional<const char *> FFA32FunctionName(uint64_t function) {
    return Lookup(kFFA32Functions, function);
}

std::optional<const char *> FFA64FunctionName(uint64_t function) {
    return Lookup(kFFA64Functions, function);
}

} // namespace esrdecoder::smccc
