#include "tagcache/storage/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace tagcache::storage {
    namespace {
        void put_u64_be(core::u8 out[8], core::u64 v) noexcept {
            for (int i = 7; i >= 0; --i) {
                out[i] = static_cast<core::u8>(v & 0xffu);
                v >>= 8;
            }
        }

        void update_field(blake3_hasher* h, std::string_view field) noexcept {
            core::u8 len[8];
            put_u64_be(len, static_cast<core::u64>(field.size()));
            blake3_hasher_update(h, len, sizeof(len));
            if (!field.empty()) {
                blake3_hasher_update(h, field.data(), field.size());
            }
        }
    } // namespace

    core::Status hash_compute(const void* data, std::size_t len, core::Hash256* out) noexcept {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Storage, core::StatusCode::Invalid);
        }
        if (len > 0 && data == nullptr) {
            return core::make_status(core::StatusDomain::Storage, core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (len > 0) {
            blake3_hasher_update(&hasher, data, len);
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return core::ok_status();
    }

    core::Status cache_key_compute(core::SchemaOwnerId owner,
                                   std::string_view command_text,
                                   std::string_view parameters,
                                   core::Hash256* out) noexcept {
        if (out == nullptr) {
            return core::make_status(core::StatusDomain::Storage, core::StatusCode::Invalid);
        }

        blake3_hasher h;
        blake3_hasher_init(&h);

        static constexpr char kLabel[] = "tagcache.cache_key.v1";
        blake3_hasher_update(&h, kLabel, sizeof(kLabel) - 1);

        core::u8 buf8[8];
        put_u64_be(buf8, owner.v);
        blake3_hasher_update(&h, buf8, sizeof(buf8));

        update_field(&h, command_text);
        update_field(&h, parameters);

        blake3_hasher_finalize(&h, out->b.data(), out->b.size());
        return core::ok_status();
    }

    std::string cache_key_hex(const core::Hash256& key) {
        static const char hex[] = "0123456789abcdef";
        std::string out;
        out.reserve(key.b.size() * 2);
        for (core::u8 b : key.b) {
            out.push_back(hex[(b >> 4) & 0xF]);
            out.push_back(hex[b & 0xF]);
        }
        return out;
    }
} // namespace tagcache::storage
