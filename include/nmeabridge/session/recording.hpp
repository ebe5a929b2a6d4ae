#pragma once

#include "../core/constants.hpp"
#include "../core/error.hpp"
#include "../core/packet.hpp"
#include "../core/types.hpp"
#include <cstdio>
#include <cstring>
#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

namespace nmeabridge::session {

    inline constexpr char RECORDING_MAGIC[4] = {'N', 'B', 'R', 'C'};

    // ─── Recording contents ─────────────────────────────────────────────────────
    struct RecordingEntry {
        u32 offset_ms = 0;
        PacketKind kind = PacketKind::Text;
        Bytes bytes;
    };

    struct RecordingHeader {
        u16 version = RECORDING_VERSION;
        dp::String source_mode;
        u64 start_epoch_ms = 0;
    };

    struct Recording {
        RecordingHeader header;
        dp::Vector<RecordingEntry> entries;
        bool truncated = false;

        u32 duration_ms() const noexcept { return entries.empty() ? 0 : entries.back().offset_ms; }
    };

    // ─── Little-endian byte helpers ─────────────────────────────────────────────
    namespace detail {
        inline void put_u16(Bytes &out, u16 v) {
            out.push_back(static_cast<u8>(v & 0xFF));
            out.push_back(static_cast<u8>((v >> 8) & 0xFF));
        }
        inline void put_u32(Bytes &out, u32 v) {
            for (u32 i = 0; i < 4; ++i)
                out.push_back(static_cast<u8>((v >> (8 * i)) & 0xFF));
        }
        inline void put_u64(Bytes &out, u64 v) {
            for (u32 i = 0; i < 8; ++i)
                out.push_back(static_cast<u8>((v >> (8 * i)) & 0xFF));
        }

        class Cursor {
            const Bytes &data_;
            usize pos_ = 0;

          public:
            explicit Cursor(const Bytes &data) : data_(data) {}

            usize remaining() const noexcept { return data_.size() - pos_; }
            usize position() const noexcept { return pos_; }

            bool read(u64 &v, usize width) {
                if (remaining() < width)
                    return false;
                v = 0;
                for (usize i = 0; i < width; ++i)
                    v |= static_cast<u64>(data_[pos_ + i]) << (8 * i);
                pos_ += width;
                return true;
            }

            bool read_bytes(Bytes &out, usize n) {
                if (remaining() < n)
                    return false;
                out.assign(data_.begin() + static_cast<isize>(pos_), data_.begin() + static_cast<isize>(pos_ + n));
                pos_ += n;
                return true;
            }
        };
    } // namespace detail

    inline Bytes encode_header(const RecordingHeader &h) {
        Bytes out;
        out.insert(out.end(), RECORDING_MAGIC, RECORDING_MAGIC + 4);
        detail::put_u16(out, h.version);
        detail::put_u16(out, static_cast<u16>(h.source_mode.size()));
        out.insert(out.end(), h.source_mode.begin(), h.source_mode.end());
        detail::put_u64(out, h.start_epoch_ms);
        return out;
    }

    inline void encode_entry(Bytes &out, const RecordingEntry &e) {
        detail::put_u32(out, e.offset_ms);
        out.push_back(static_cast<u8>(e.kind));
        detail::put_u32(out, static_cast<u32>(e.bytes.size()));
        out.insert(out.end(), e.bytes.begin(), e.bytes.end());
    }

    // A truncated trailing entry is dropped and flagged, not an error
    inline Result<Recording> decode_recording(const Bytes &data) {
        detail::Cursor cur(data);
        Bytes magic;
        if (!cur.read_bytes(magic, 4) || std::memcmp(magic.data(), RECORDING_MAGIC, 4) != 0)
            return Result<Recording>::err(Error::invalid_recording("bad magic"));

        Recording rec;
        u64 v = 0;
        if (!cur.read(v, 2))
            return Result<Recording>::err(Error::invalid_recording("truncated header"));
        rec.header.version = static_cast<u16>(v);
        if (rec.header.version != RECORDING_VERSION) {
            return Result<Recording>::err(Error::invalid_recording(
                "unsupported recording version " + dp::String(std::to_string(rec.header.version))));
        }
        Bytes mode;
        if (!cur.read(v, 2) || !cur.read_bytes(mode, static_cast<usize>(v)))
            return Result<Recording>::err(Error::invalid_recording("truncated header"));
        rec.header.source_mode = dp::String(mode.begin(), mode.end());
        if (!cur.read(v, 8))
            return Result<Recording>::err(Error::invalid_recording("truncated header"));
        rec.header.start_epoch_ms = v;

        while (cur.remaining() > 0) {
            RecordingEntry e;
            u64 offset = 0, kind = 0, len = 0;
            if (!cur.read(offset, 4) || !cur.read(kind, 1) || !cur.read(len, 4) ||
                !cur.read_bytes(e.bytes, static_cast<usize>(len))) {
                rec.truncated = true;
                break;
            }
            if (kind > 1) {
                return Result<Recording>::err(Error::invalid_recording(
                    "unknown entry kind at byte " + dp::String(std::to_string(cur.position()))));
            }
            e.offset_ms = static_cast<u32>(offset);
            e.kind = static_cast<PacketKind>(kind);
            rec.entries.push_back(std::move(e));
        }
        return Result<Recording>::ok(std::move(rec));
    }

    // ─── File I/O ───────────────────────────────────────────────────────────────
    inline Result<Bytes> read_file(const dp::String &path) {
        std::FILE *f = std::fopen(path.c_str(), "rb");
        if (!f)
            return Result<Bytes>::err(Error::io_error("cannot open " + path));
        Bytes data;
        u8 buf[4096];
        usize n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
            data.insert(data.end(), buf, buf + n);
        bool failed = std::ferror(f) != 0;
        std::fclose(f);
        if (failed)
            return Result<Bytes>::err(Error::io_error("read failed: " + path));
        return Result<Bytes>::ok(std::move(data));
    }

    inline Result<Recording> load_recording(const dp::String &path) {
        auto data = read_file(path);
        if (data.is_err())
            return Result<Recording>::err(data.error());
        auto rec = decode_recording(data.value());
        if (rec.is_ok() && rec.value().truncated) {
            echo::category("nmeabridge.recorder")
                .warn(path, ": truncated trailing entry ignored, ", rec.value().entries.size(), " entries kept");
        }
        return rec;
    }

} // namespace nmeabridge::session
