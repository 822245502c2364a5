#include "ReportWriter.h"
#include "Config.h"
#include "Logging.h"
#include "Utils.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#ifdef HOST_AUDIT_HAVE_OPENSSL
#include <openssl/evp.h>
#endif

namespace fs = std::filesystem;

namespace host_audit {

std::string ReportWriter::base_name(const Report& report) const {
    return cfg_.report_prefix + utils::format_local_time(report.generated_at(), "%Y-%m-%d_%H-%M-%S");
}

std::string ReportWriter::next_free_path(const std::string& base) const {
    fs::path dir(cfg_.output_dir);
    fs::path candidate = dir / (base + ".txt");
    std::error_code ec;
    for(int seq = 1; fs::exists(candidate, ec); ++seq){
        candidate = dir / (base + "_" + std::to_string(seq) + ".txt");
    }
    return candidate.string();
}

std::optional<std::string> ReportWriter::write(const Report& report) const {
    const std::string path = next_free_path(base_name(report));
    const std::string text = report.render();
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if(!ofs){
        const int open_errno = errno;
        Logger::instance().error("Failed to write report to " + path + ": " + std::strerror(open_errno));
        return std::nullopt;
    }
    ofs << text;
    ofs.close();
    if(!ofs){
        Logger::instance().error("Failed to write report to " + path);
        return std::nullopt;
    }
    Logger::instance().info("Report written to " + path);
    std::string digest = sha256_hex(text);
    if(!digest.empty()) Logger::instance().info("Report SHA256: " + digest);
    return path;
}

std::string sha256_hex(const std::string& data){
    std::string hexsum;
#ifdef HOST_AUDIT_HAVE_OPENSSL
    unsigned char md[EVP_MAX_MD_SIZE]; unsigned int mdlen = 0;
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if(ctx && EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)==1 && EVP_DigestUpdate(ctx, data.data(), data.size())==1 && EVP_DigestFinal_ex(ctx, md, &mdlen)==1){
        static const char* hx = "0123456789abcdef";
        hexsum.reserve(mdlen * 2);
        for(unsigned i=0;i<mdlen;i++){ hexsum.push_back(hx[md[i]>>4]); hexsum.push_back(hx[md[i]&0xF]); }
    }
    if(ctx) EVP_MD_CTX_free(ctx);
#else
    (void)data;
#endif
    return hexsum;
}

}
