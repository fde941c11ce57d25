#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

std::string hex_from_bytes(const unsigned char* data, std::size_t size){
    std::ostringstream oss;
    for(std::size_t i = 0; i < size; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    return oss.str();
}

std::string hex_from_u32(uint32_t value){
    std::ostringstream oss;
    oss << std::hex << std::setw(8) << std::setfill('0') << value;
    return oss.str();
}

std::string to_lower_copy(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string lower_extension(const std::filesystem::path& path){
    return to_lower_copy(path.extension().string());
}

const std::vector<std::string>& rom_extensions(){
    static const std::vector<std::string> kExtensions = {
        ".nes", ".smc", ".sfc", ".gb", ".gbc", ".gba", ".n64", ".z64",
        ".v64", ".nds", ".iso", ".cue", ".bin", ".smd", ".md", ".32x",
        ".gg", ".sms", ".zip", ".7z", ".rom", ".ccd", ".chd"
    };
    return kExtensions;
}

bool is_rom_file(const std::filesystem::path& path){
    auto ext = lower_extension(path);
    if(ext.empty()) return false;
    const auto& known = rom_extensions();
    return std::find(known.begin(), known.end(), ext) != known.end();
}

namespace {

struct Group {
    std::size_t begin;
    std::size_t end;
    std::string content;
};

// Non-empty open...close groups, left to right.
std::vector<Group> find_groups(const std::string& text, char open, char close){
    std::vector<Group> groups;
    std::size_t pos = 0;
    while((pos = text.find(open, pos)) != std::string::npos){
        auto stop = text.find(close, pos + 1);
        if(stop == std::string::npos) break;
        auto content = text.substr(pos + 1, stop - pos - 1);
        if(!content.empty() && content.find(open) == std::string::npos){
            groups.push_back({pos, stop + 1, content});
            pos = stop + 1;
        } else {
            ++pos;
        }
    }
    return groups;
}

bool is_version_group(const std::string& content){
    return content.size() > 1 && content[0] == 'v';
}

} // namespace

RomNameParts parse_rom_name(const std::string& filename){
    const std::string base = std::filesystem::path(filename).stem().string();
    RomNameParts parts;
    std::vector<bool> removed(base.size(), false);
    auto remove = [&removed](const Group& group){
        std::fill(removed.begin() + group.begin, removed.begin() + group.end, true);
    };

    bool have_region = false;
    bool have_version = false;
    for(const auto& group : find_groups(base, '(', ')')){
        if(is_version_group(group.content)){
            if(have_version) continue;
            parts.version = group.content.substr(1);
            have_version = true;
        } else {
            if(have_region) continue;
            parts.region = group.content;
            have_region = true;
        }
        remove(group);
    }
    for(const auto& group : find_groups(base, '[', ']')){
        parts.attributes.push_back(group.content);
        remove(group);
    }

    std::string title;
    bool pending_space = false;
    for(std::size_t i = 0; i < base.size(); ++i){
        if(removed[i]) continue;
        if(std::isspace(static_cast<unsigned char>(base[i]))){
            pending_space = !title.empty();
            continue;
        }
        if(pending_space) title += ' ';
        pending_space = false;
        title += base[i];
    }
    parts.title = title;
    return parts;
}

std::string create_standardized_name(const RomNameParts& parts, const std::string& extension){
    std::string name = parts.title;
    if(!parts.region.empty()) name += " (" + parts.region + ")";
    if(!parts.version.empty()) name += " (v" + parts.version + ")";
    for(const auto& attribute : parts.attributes) name += " [" + attribute + "]";
    return name + extension;
}

bool is_dat_file(const std::filesystem::path& path){
    auto ext = lower_extension(path);
    return ext == ".dat" || ext == ".xml";
}
