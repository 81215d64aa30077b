#include "content_hasher.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace svcs {

namespace {

std::string hashToHexString(const unsigned char* hash)
{
    std::ostringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
    return ss.str();
}

}

std::string computeIdentifier(const std::vector<TrackedFile>& files)
{
    std::string stream;
    for (const auto& f : files) {
        stream += f.name;
        stream += f.content;
    }

    unsigned char sha[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(stream.data()), stream.size(), sha);
    return hashToHexString(sha);
}

}
