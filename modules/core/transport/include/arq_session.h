#pragma once

#include "settings.h"

#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

namespace ferry::transport {

// Segment commands
inline constexpr uint8_t kCmdPush = 81;
inline constexpr uint8_t kCmdAck = 82;
inline constexpr uint8_t kCmdWask = 83;  // window probe (ask)
inline constexpr uint8_t kCmdWins = 84;  // window size (tell)

// conv u32 | cmd u8 | frg u8 | wnd u16 | ts u32 | sn u32 | una u32 | len u32, little endian
inline constexpr size_t kArqHeaderSize = 24;

/**
 * Selective-repeat ARQ state machine in stream mode.
 *
 * Not thread-safe: the owner serializes every call. Produces outgoing
 * datagrams through the output callback from flush()/update() only.
 */
class ArqSession {
public:
    using OutputFn = std::function<void(const uint8_t* data, size_t len)>;

    // mtu is the datagram budget available to this layer (after encryption overhead).
    ArqSession(uint32_t conv, const TransportTuning& tuning, int mtu, OutputFn output);

    // Queues bytes for sending. Stream mode: bytes may merge into the last queued segment.
    void send(const uint8_t* data, size_t len);

    // Copies up to len in-order bytes. Returns 0 when nothing is readable.
    size_t recv(uint8_t* buf, size_t len);
    size_t readable() const;

    // Feeds one decrypted datagram. Returns false when it is malformed or belongs to another conversation.
    bool input(const uint8_t* data, size_t len);

    // Drives timers. Call every interval with a monotonic millisecond clock.
    void update(uint32_t now_ms);
    void flush();

    size_t wait_send() const { return m_snd_buf.size() + m_snd_queue.size(); }
    size_t mss() const { return m_mss; }
    uint32_t send_window() const { return m_snd_wnd; }
    uint32_t conv() const { return m_conv; }
    bool dead() const { return m_dead; }
    uint32_t srtt() const { return m_srtt; }
    uint32_t rto() const { return m_rx_rto; }
    uint64_t retransmissions() const { return m_xmit_total; }

    // Reads the conversation id of a datagram without consuming it.
    static bool peek_conv(const uint8_t* data, size_t len, uint32_t& conv);

private:
    struct Segment {
        uint32_t conv = 0;
        uint8_t cmd = 0;
        uint8_t frg = 0;
        uint16_t wnd = 0;
        uint32_t ts = 0;
        uint32_t sn = 0;
        uint32_t una = 0;
        uint32_t resendts = 0;
        uint32_t rto = 0;
        uint32_t fastack = 0;
        uint32_t xmit = 0;
        std::vector<uint8_t> data;
    };

    uint16_t window_unused() const;
    void encode_segment(const Segment& seg);
    void emit_if_full(size_t need);
    void emit_buffer();
    void update_ack(int32_t rtt);
    void shrink_buf();
    void parse_ack(uint32_t sn);
    void parse_una(uint32_t una);
    void parse_fastack(uint32_t sn, uint32_t ts);
    void parse_data(Segment&& seg);
    void move_ready_segments();

    uint32_t m_conv;
    uint32_t m_mtu;
    uint32_t m_mss;
    OutputFn m_output;

    uint32_t m_snd_una = 0;
    uint32_t m_snd_nxt = 0;
    uint32_t m_rcv_nxt = 0;

    uint32_t m_ssthresh = 2;
    int32_t m_rx_rttval = 0;
    int32_t m_srtt = 0;
    uint32_t m_rx_rto = 200;
    uint32_t m_rx_minrto;

    uint32_t m_snd_wnd;
    uint32_t m_rcv_wnd;
    uint32_t m_rmt_wnd;
    uint32_t m_cwnd = 1;
    uint32_t m_incr = 0;
    uint32_t m_probe = 0;
    uint32_t m_ts_probe = 0;
    uint32_t m_probe_wait = 0;

    uint32_t m_current = 0;
    uint32_t m_interval;
    uint32_t m_ts_flush;
    bool m_updated = false;
    bool m_nodelay;
    bool m_nocwnd;
    uint32_t m_fastresend;
    uint32_t m_dead_link;
    bool m_dead = false;
    uint64_t m_xmit_total = 0;

    std::deque<Segment> m_snd_queue;
    std::deque<Segment> m_snd_buf;
    std::deque<Segment> m_rcv_buf;
    std::deque<Segment> m_rcv_queue;
    size_t m_rcv_offset = 0;  // bytes already consumed from m_rcv_queue.front()
    std::vector<std::pair<uint32_t, uint32_t>> m_acklist;  // (sn, ts)

    std::vector<uint8_t> m_buffer;
};

} // namespace ferry::transport
