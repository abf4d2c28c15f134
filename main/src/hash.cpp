#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace {
    // Custom deleter for EVP_MD_CTX
    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) {
                EVP_MD_CTX_free(ctx);
            }
        }
    };

    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

    const EVP_MD* evp_for(DigestAlgorithm algorithm) {
        switch (algorithm) {
            case DigestAlgorithm::Md5: return EVP_md5();
            case DigestAlgorithm::Sha1: return EVP_sha1();
            case DigestAlgorithm::Sha256: return EVP_sha256();
        }
        return EVP_sha256();
    }

    EvpMdCtxPtr start_digest(DigestAlgorithm algorithm) {
        EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
        if (!md_ctx) {
            throw GhrelException(get_string("error.openssl_ctx_failed"));
        }
        if (EVP_DigestInit_ex(md_ctx.get(), evp_for(algorithm), nullptr) != 1) {
            throw GhrelException(get_string("error.openssl_init_failed"));
        }
        return md_ctx;
    }

    void update_digest(EVP_MD_CTX* ctx, const char* data, size_t size) {
        if (EVP_DigestUpdate(ctx, data, size) != 1) {
            throw GhrelException(get_string("error.openssl_update_failed"));
        }
    }

    std::string finish_digest(EVP_MD_CTX* ctx) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len = 0;
        if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
            throw GhrelException(get_string("error.openssl_final_failed"));
        }

        std::stringstream ss;
        for (unsigned int i = 0; i < hash_len; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return ss.str();
    }
}

std::string_view digest_extension(DigestAlgorithm algorithm) {
    switch (algorithm) {
        case DigestAlgorithm::Md5: return "md5";
        case DigestAlgorithm::Sha1: return "sha1";
        case DigestAlgorithm::Sha256: return "sha256";
    }
    return "";
}

std::string calculate_digest(DigestAlgorithm algorithm, std::string_view data) {
    EvpMdCtxPtr md_ctx = start_digest(algorithm);
    update_digest(md_ctx.get(), data.data(), data.size());
    return finish_digest(md_ctx.get());
}

std::string calculate_file_digest(DigestAlgorithm algorithm, const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw GhrelException(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr md_ctx = start_digest(algorithm);
    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
        update_digest(md_ctx.get(), buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.gcount() > 0) {
        update_digest(md_ctx.get(), buffer, static_cast<size_t>(file.gcount()));
    }
    return finish_digest(md_ctx.get());
}
