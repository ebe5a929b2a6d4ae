#pragma once

#include "../core/error.hpp"
#include "identifier.hpp"
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace nmeabridge::nmea {

    // ─── NMEA 2000 fast packet ──────────────────────────────────────────────────
    // First frame: [seq:3|frame:5][total bytes][6 data bytes]
    // Later:       [seq:3|frame:5][7 data bytes]
    // Unused trailing bytes are 0xFF.
    class FastPacketSender {
        u8 sequence_ = 0;

      public:
        static constexpr u32 FIRST_FRAME_DATA = 6;
        static constexpr u32 SUBSEQUENT_FRAME_DATA = 7;

        Result<dp::Vector<Frame>> split(PGN pgn, const Bytes &data, Address source,
                                        Priority prio = Priority::Default) {
            if (data.size() > FAST_PACKET_MAX_DATA) {
                return Result<dp::Vector<Frame>>::err(Error::buffer_overflow());
            }
            if (data.size() <= CAN_DATA_LENGTH) {
                return Result<dp::Vector<Frame>>::err(Error::invalid_argument("single frame payload"));
            }

            u8 seq = static_cast<u8>((sequence_++ & 0x07) << 5);
            usize total_frames = 1 + (data.size() - FIRST_FRAME_DATA + SUBSEQUENT_FRAME_DATA - 1) /
                                         SUBSEQUENT_FRAME_DATA;
            Identifier id = Identifier::encode(prio, pgn, source);

            dp::Vector<Frame> frames;
            frames.reserve(total_frames);
            usize offset = 0;
            for (usize n = 0; n < total_frames; ++n) {
                Frame f;
                f.id = id;
                f.data[0] = static_cast<u8>(seq | (n & 0x1F));
                usize first = 1;
                usize chunk = SUBSEQUENT_FRAME_DATA;
                if (n == 0) {
                    f.data[1] = static_cast<u8>(data.size());
                    first = 2;
                    chunk = FIRST_FRAME_DATA;
                }
                for (usize i = 0; i < chunk; ++i) {
                    f.data[first + i] = offset + i < data.size() ? data[offset + i] : 0xFF;
                }
                offset += chunk;
                frames.push_back(f);
            }
            echo::category("nmeabridge.nmea.fp").trace("fast packet pgn=", pgn, " bytes=", data.size(),
                                                      " frames=", frames.size());
            return Result<dp::Vector<Frame>>::ok(std::move(frames));
        }
    };

    // ─── Reassembly of received fast packets ────────────────────────────────────
    class FastPacketAssembler {
        struct Session {
            PGN pgn = 0;
            Address source = 0;
            u8 sequence = 0;
            u8 expected = 0;
            usize total = 0;
            usize received = 0;
            Bytes data;
        };

        dp::Vector<Session> sessions_;

        void drop(Address src, PGN pgn) {
            for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
                if (it->source == src && it->pgn == pgn) {
                    sessions_.erase(it);
                    return;
                }
            }
        }

      public:
        // Returns the complete payload once the last frame arrives
        dp::Optional<Bytes> feed(const Frame &frame) {
            u8 counter = frame.data[0] & 0x1F;
            u8 seq = (frame.data[0] >> 5) & 0x07;
            Address src = frame.source();
            PGN pgn = frame.pgn();

            if (counter == 0) {
                drop(src, pgn);
                Session s;
                s.pgn = pgn;
                s.source = src;
                s.sequence = seq;
                s.expected = 1;
                s.total = frame.data[1];
                s.data.assign(s.total, 0xFF);
                usize n = s.total < FastPacketSender::FIRST_FRAME_DATA ? s.total : FastPacketSender::FIRST_FRAME_DATA;
                for (usize i = 0; i < n; ++i)
                    s.data[i] = frame.data[i + 2];
                s.received = n;
                if (s.received >= s.total)
                    return s.data;
                sessions_.push_back(std::move(s));
                return dp::nullopt;
            }

            for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
                if (it->source != src || it->pgn != pgn || it->sequence != seq)
                    continue;
                if (counter != it->expected) {
                    echo::category("nmeabridge.nmea.fp")
                        .warn("bad sequence: expected=", it->expected, " got=", counter);
                    sessions_.erase(it);
                    return dp::nullopt;
                }
                usize offset = FastPacketSender::FIRST_FRAME_DATA +
                               (counter - 1) * FastPacketSender::SUBSEQUENT_FRAME_DATA;
                for (usize i = 0; i < FastPacketSender::SUBSEQUENT_FRAME_DATA && offset + i < it->total; ++i)
                    it->data[offset + i] = frame.data[i + 1];
                it->received = offset + FastPacketSender::SUBSEQUENT_FRAME_DATA;
                it->expected++;
                if (it->received >= it->total) {
                    Bytes out = std::move(it->data);
                    sessions_.erase(it);
                    return out;
                }
                return dp::nullopt;
            }
            return dp::nullopt;
        }

        usize pending() const noexcept { return sessions_.size(); }
    };

} // namespace nmeabridge::nmea
