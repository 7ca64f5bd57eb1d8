#include "arq_session.h"
#include "logger.h"

#include <algorithm>
#include <cstring>
#include <iterator>
#include <string>

namespace ferry::transport {

namespace {

constexpr uint32_t kAskSend = 1;  // need to send WASK
constexpr uint32_t kAskTell = 2;  // need to send WINS
constexpr uint32_t kRtoMax = 60000;
constexpr uint32_t kProbeInit = 7000;
constexpr uint32_t kProbeLimit = 120000;
constexpr uint32_t kThreshMin = 2;

inline int32_t timediff(uint32_t later, uint32_t earlier) {
    return static_cast<int32_t>(later - earlier);
}

inline void put_u16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
}

inline void put_u32(uint8_t* p, uint32_t v) {
    p[0] = static_cast<uint8_t>(v);
    p[1] = static_cast<uint8_t>(v >> 8);
    p[2] = static_cast<uint8_t>(v >> 16);
    p[3] = static_cast<uint8_t>(v >> 24);
}

inline uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

ArqSession::ArqSession(uint32_t conv, const TransportTuning& tuning, int mtu, OutputFn output)
    : m_conv(conv),
      m_mtu(static_cast<uint32_t>(std::max(mtu, static_cast<int>(kArqHeaderSize) + 64))),
      m_mss(m_mtu - static_cast<uint32_t>(kArqHeaderSize)),
      m_output(std::move(output)),
      m_rx_minrto(static_cast<uint32_t>(std::max(1, tuning.min_rto_ms))),
      m_snd_wnd(static_cast<uint32_t>(std::max(1, tuning.send_window))),
      m_rcv_wnd(static_cast<uint32_t>(std::max(1, tuning.receive_window))),
      m_rmt_wnd(static_cast<uint32_t>(std::max(1, tuning.receive_window))),
      m_interval(static_cast<uint32_t>(std::clamp(tuning.interval_ms, 1, 5000))),
      m_ts_flush(m_interval),
      m_nodelay(tuning.nodelay),
      m_nocwnd(tuning.no_congestion),
      m_fastresend(static_cast<uint32_t>(std::max(0, tuning.fast_resend))),
      m_dead_link(static_cast<uint32_t>(std::max(1, tuning.dead_link))) {
    if (!m_nodelay) {
        m_rx_minrto = std::max<uint32_t>(m_rx_minrto, 100);
    }
    m_buffer.reserve(m_mtu);
}

bool ArqSession::peek_conv(const uint8_t* data, size_t len, uint32_t& conv) {
    if (len < kArqHeaderSize) {
        return false;
    }
    conv = get_u32(data);
    return true;
}

void ArqSession::send(const uint8_t* data, size_t len) {
    if (len == 0) {
        return;
    }
    // Stream mode: top up the last queued segment first
    if (!m_snd_queue.empty()) {
        Segment& last = m_snd_queue.back();
        if (last.data.size() < m_mss) {
            size_t take = std::min(len, static_cast<size_t>(m_mss) - last.data.size());
            last.data.insert(last.data.end(), data, data + take);
            data += take;
            len -= take;
        }
    }
    while (len > 0) {
        size_t take = std::min(len, static_cast<size_t>(m_mss));
        Segment seg;
        seg.data.assign(data, data + take);
        m_snd_queue.push_back(std::move(seg));
        data += take;
        len -= take;
    }
}

size_t ArqSession::readable() const {
    size_t total = 0;
    for (const auto& seg : m_rcv_queue) {
        total += seg.data.size();
    }
    return total - m_rcv_offset;
}

size_t ArqSession::recv(uint8_t* buf, size_t len) {
    if (m_rcv_queue.empty() || len == 0) {
        return 0;
    }
    bool recover = m_rcv_queue.size() >= m_rcv_wnd;

    size_t copied = 0;
    while (copied < len && !m_rcv_queue.empty()) {
        Segment& front = m_rcv_queue.front();
        size_t avail = front.data.size() - m_rcv_offset;
        size_t take = std::min(avail, len - copied);
        std::memcpy(buf + copied, front.data.data() + m_rcv_offset, take);
        copied += take;
        m_rcv_offset += take;
        if (m_rcv_offset == front.data.size()) {
            m_rcv_queue.pop_front();
            m_rcv_offset = 0;
        }
    }

    move_ready_segments();

    // Window reopened: tell the peer right away
    if (recover && m_rcv_queue.size() < m_rcv_wnd) {
        m_probe |= kAskTell;
    }
    return copied;
}

void ArqSession::move_ready_segments() {
    while (!m_rcv_buf.empty()) {
        Segment& seg = m_rcv_buf.front();
        if (seg.sn != m_rcv_nxt || m_rcv_queue.size() >= m_rcv_wnd) {
            break;
        }
        m_rcv_queue.push_back(std::move(seg));
        m_rcv_buf.pop_front();
        m_rcv_nxt++;
    }
}

void ArqSession::update_ack(int32_t rtt) {
    if (m_srtt == 0) {
        m_srtt = rtt;
        m_rx_rttval = rtt / 2;
    } else {
        int32_t delta = rtt - m_srtt;
        if (delta < 0) delta = -delta;
        m_rx_rttval = (3 * m_rx_rttval + delta) / 4;
        m_srtt = (7 * m_srtt + rtt) / 8;
        if (m_srtt < 1) m_srtt = 1;
    }
    int32_t rto = m_srtt + std::max<int32_t>(static_cast<int32_t>(m_interval), 4 * m_rx_rttval);
    m_rx_rto = std::clamp<uint32_t>(static_cast<uint32_t>(rto), m_rx_minrto, kRtoMax);
}

void ArqSession::shrink_buf() {
    m_snd_una = m_snd_buf.empty() ? m_snd_nxt : m_snd_buf.front().sn;
}

void ArqSession::parse_ack(uint32_t sn) {
    if (timediff(sn, m_snd_una) < 0 || timediff(sn, m_snd_nxt) >= 0) {
        return;
    }
    for (auto it = m_snd_buf.begin(); it != m_snd_buf.end(); ++it) {
        if (it->sn == sn) {
            m_snd_buf.erase(it);
            break;
        }
        if (timediff(sn, it->sn) < 0) {
            break;
        }
    }
}

void ArqSession::parse_una(uint32_t una) {
    while (!m_snd_buf.empty() && timediff(una, m_snd_buf.front().sn) > 0) {
        m_snd_buf.pop_front();
    }
}

void ArqSession::parse_fastack(uint32_t sn, uint32_t ts) {
    if (timediff(sn, m_snd_una) < 0 || timediff(sn, m_snd_nxt) >= 0) {
        return;
    }
    for (auto& seg : m_snd_buf) {
        if (timediff(sn, seg.sn) < 0) {
            break;
        }
        if (sn != seg.sn && timediff(ts, seg.ts) >= 0) {
            seg.fastack++;
        }
    }
}

void ArqSession::parse_data(Segment&& seg) {
    uint32_t sn = seg.sn;
    if (timediff(sn, m_rcv_nxt + m_rcv_wnd) >= 0 || timediff(sn, m_rcv_nxt) < 0) {
        return;
    }

    // Insert sorted by sn, dropping duplicates
    auto it = m_rcv_buf.end();
    bool repeat = false;
    while (it != m_rcv_buf.begin()) {
        auto prev = std::prev(it);
        if (prev->sn == sn) {
            repeat = true;
            break;
        }
        if (timediff(sn, prev->sn) > 0) {
            break;
        }
        it = prev;
    }
    if (!repeat) {
        m_rcv_buf.insert(it, std::move(seg));
    }
    move_ready_segments();
}

bool ArqSession::input(const uint8_t* data, size_t len) {
    if (len < kArqHeaderSize) {
        return false;
    }

    uint32_t prev_una = m_snd_una;
    bool got_ack = false;
    uint32_t max_ack = 0;
    uint32_t latest_ts = 0;

    while (len >= kArqHeaderSize) {
        uint32_t conv = get_u32(data);
        if (conv != m_conv) {
            return false;
        }
        uint8_t cmd = data[4];
        uint16_t wnd = get_u16(data + 6);
        uint32_t ts = get_u32(data + 8);
        uint32_t sn = get_u32(data + 12);
        uint32_t una = get_u32(data + 16);
        uint32_t seg_len = get_u32(data + 20);
        data += kArqHeaderSize;
        len -= kArqHeaderSize;

        if (len < seg_len) {
            return false;
        }
        if (cmd != kCmdPush && cmd != kCmdAck && cmd != kCmdWask && cmd != kCmdWins) {
            return false;
        }

        m_rmt_wnd = wnd;
        parse_una(una);
        shrink_buf();

        if (cmd == kCmdAck) {
            if (timediff(m_current, ts) >= 0) {
                update_ack(timediff(m_current, ts));
            }
            parse_ack(sn);
            shrink_buf();
            if (!got_ack) {
                got_ack = true;
                max_ack = sn;
                latest_ts = ts;
            } else if (timediff(sn, max_ack) > 0) {
                max_ack = sn;
                latest_ts = ts;
            }
        } else if (cmd == kCmdPush) {
            if (timediff(sn, m_rcv_nxt + m_rcv_wnd) < 0) {
                m_acklist.emplace_back(sn, ts);
                if (timediff(sn, m_rcv_nxt) >= 0) {
                    Segment seg;
                    seg.conv = conv;
                    seg.cmd = cmd;
                    seg.wnd = wnd;
                    seg.ts = ts;
                    seg.sn = sn;
                    seg.una = una;
                    seg.data.assign(data, data + seg_len);
                    parse_data(std::move(seg));
                }
            }
        } else if (cmd == kCmdWask) {
            m_probe |= kAskTell;
        }
        // WINS carries nothing beyond the window already recorded

        data += seg_len;
        len -= seg_len;
    }

    if (got_ack) {
        parse_fastack(max_ack, latest_ts);
    }

    if (!m_nocwnd && timediff(m_snd_una, prev_una) > 0 && m_cwnd < m_rmt_wnd) {
        uint32_t mss = m_mss;
        if (m_cwnd < m_ssthresh) {
            m_cwnd++;
            m_incr += mss;
        } else {
            if (m_incr < mss) m_incr = mss;
            m_incr += (mss * mss) / m_incr + (mss / 16);
            if ((m_cwnd + 1) * mss <= m_incr) {
                m_cwnd = (m_incr + mss - 1) / (mss > 0 ? mss : 1);
            }
        }
        if (m_cwnd > m_rmt_wnd) {
            m_cwnd = m_rmt_wnd;
            m_incr = m_rmt_wnd * mss;
        }
    }
    return true;
}

uint16_t ArqSession::window_unused() const {
    if (m_rcv_queue.size() < m_rcv_wnd) {
        return static_cast<uint16_t>(std::min<size_t>(m_rcv_wnd - m_rcv_queue.size(), 0xFFFF));
    }
    return 0;
}

void ArqSession::emit_buffer() {
    if (!m_buffer.empty()) {
        m_output(m_buffer.data(), m_buffer.size());
        m_buffer.clear();
    }
}

void ArqSession::emit_if_full(size_t need) {
    if (m_buffer.size() + need > m_mtu) {
        emit_buffer();
    }
}

void ArqSession::encode_segment(const Segment& seg) {
    size_t off = m_buffer.size();
    m_buffer.resize(off + kArqHeaderSize);
    uint8_t* p = m_buffer.data() + off;
    put_u32(p, seg.conv);
    p[4] = seg.cmd;
    p[5] = seg.frg;
    put_u16(p + 6, seg.wnd);
    put_u32(p + 8, seg.ts);
    put_u32(p + 12, seg.sn);
    put_u32(p + 16, seg.una);
    put_u32(p + 20, static_cast<uint32_t>(seg.data.size()));
    m_buffer.insert(m_buffer.end(), seg.data.begin(), seg.data.end());
}

void ArqSession::flush() {
    if (!m_updated) {
        return;
    }
    uint32_t current = m_current;

    Segment ctl;
    ctl.conv = m_conv;
    ctl.wnd = window_unused();
    ctl.una = m_rcv_nxt;

    // Pending acks
    ctl.cmd = kCmdAck;
    for (const auto& ack : m_acklist) {
        emit_if_full(kArqHeaderSize);
        ctl.sn = ack.first;
        ctl.ts = ack.second;
        encode_segment(ctl);
    }
    m_acklist.clear();

    // Probe the peer when it advertised a zero window
    if (m_rmt_wnd == 0) {
        if (m_probe_wait == 0) {
            m_probe_wait = kProbeInit;
            m_ts_probe = current + m_probe_wait;
        } else if (timediff(current, m_ts_probe) >= 0) {
            m_probe_wait = std::min(m_probe_wait + m_probe_wait / 2, kProbeLimit);
            m_ts_probe = current + m_probe_wait;
            m_probe |= kAskSend;
        }
    } else {
        m_ts_probe = 0;
        m_probe_wait = 0;
    }

    ctl.sn = 0;
    ctl.ts = 0;
    if (m_probe & kAskSend) {
        ctl.cmd = kCmdWask;
        emit_if_full(kArqHeaderSize);
        encode_segment(ctl);
    }
    if (m_probe & kAskTell) {
        ctl.cmd = kCmdWins;
        emit_if_full(kArqHeaderSize);
        encode_segment(ctl);
    }
    m_probe = 0;

    uint32_t cwnd = std::min(m_snd_wnd, m_rmt_wnd);
    if (!m_nocwnd) {
        cwnd = std::min(m_cwnd, cwnd);
    }

    // Admit queued data into the send window
    while (timediff(m_snd_nxt, m_snd_una + cwnd) < 0 && !m_snd_queue.empty()) {
        Segment seg = std::move(m_snd_queue.front());
        m_snd_queue.pop_front();
        seg.conv = m_conv;
        seg.cmd = kCmdPush;
        seg.ts = current;
        seg.sn = m_snd_nxt++;
        seg.una = m_rcv_nxt;
        seg.resendts = current;
        seg.rto = m_rx_rto;
        seg.fastack = 0;
        seg.xmit = 0;
        m_snd_buf.push_back(std::move(seg));
    }

    uint32_t resent = m_fastresend > 0 ? m_fastresend : 0xFFFFFFFFu;
    uint32_t rtomin = m_nodelay ? 0 : (m_rx_rto >> 3);
    bool lost = false;
    bool change = false;

    for (auto& seg : m_snd_buf) {
        bool needsend = false;
        if (seg.xmit == 0) {
            needsend = true;
            seg.xmit++;
            seg.rto = m_rx_rto;
            seg.resendts = current + seg.rto + rtomin;
        } else if (timediff(current, seg.resendts) >= 0) {
            needsend = true;
            seg.xmit++;
            m_xmit_total++;
            if (!m_nodelay) {
                seg.rto += std::max(seg.rto, m_rx_rto);
            } else {
                seg.rto += seg.rto / 2;
            }
            seg.resendts = current + seg.rto;
            lost = true;
        } else if (seg.fastack >= resent) {
            needsend = true;
            seg.xmit++;
            m_xmit_total++;
            seg.fastack = 0;
            seg.resendts = current + seg.rto;
            change = true;
        }

        if (needsend) {
            seg.ts = current;
            seg.wnd = ctl.wnd;
            seg.una = m_rcv_nxt;
            emit_if_full(kArqHeaderSize + seg.data.size());
            encode_segment(seg);
            if (seg.xmit >= m_dead_link && !m_dead) {
                m_dead = true;
                LOG_WARN("ARQ: conv " + std::to_string(m_conv) + " link dead after " +
                         std::to_string(seg.xmit) + " transmissions of sn " + std::to_string(seg.sn));
            }
        }
    }

    emit_buffer();

    if (!m_nocwnd) {
        if (change) {
            uint32_t inflight = m_snd_nxt - m_snd_una;
            m_ssthresh = std::max(inflight / 2, kThreshMin);
            m_cwnd = m_ssthresh + resent;
            m_incr = m_cwnd * m_mss;
        }
        if (lost) {
            m_ssthresh = std::max(cwnd / 2, kThreshMin);
            m_cwnd = 1;
            m_incr = m_mss;
        }
        if (m_cwnd < 1) {
            m_cwnd = 1;
            m_incr = m_mss;
        }
    }
}

void ArqSession::update(uint32_t now_ms) {
    m_current = now_ms;
    if (!m_updated) {
        m_updated = true;
        m_ts_flush = m_current;
    }

    int32_t slap = timediff(m_current, m_ts_flush);
    if (slap >= 10000 || slap < -10000) {
        m_ts_flush = m_current;
        slap = 0;
    }
    if (slap >= 0) {
        m_ts_flush += m_interval;
        if (timediff(m_current, m_ts_flush) >= 0) {
            m_ts_flush = m_current + m_interval;
        }
        flush();
    }
}

} // namespace ferry::transport
