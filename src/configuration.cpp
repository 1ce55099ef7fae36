#include <coincidence/configuration.hpp>

#include <filesystem>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <unordered_map>
#include <vector>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/ini_parser.hpp>

namespace fs = std::filesystem;

// specialize ini_parser write_keys so as to use git-style spacing
namespace boost { namespace property_tree { namespace ini_parser {
namespace detail {
template <>
void write_keys<ptree>(std::basic_ostream<ptree::key_type::value_type> & stream, const ptree& pt, bool throw_on_children)
{
    typedef typename ptree::key_type::value_type Ch;
    for (typename ptree::const_iterator it = pt.begin(), end = pt.end();
         it != end; ++it)
    {
        if (!it->second.empty()) {
            if (throw_on_children) {
                BOOST_PROPERTY_TREE_THROW(ini_parser_error(
                    "ptree is too deep", "", 0));
            }
            continue;
        }
        if (throw_on_children) {
            // indent innermost keys
            stream << Ch('\t');
        }
        stream << it->first << " = "
            << it->second.template get_value<
                std::basic_string<Ch> >()
            << Ch('\n');
    }
}
}
} } }

namespace coincidence {

namespace {

using ptree = boost::property_tree::ptree;

constexpr std::string_view LOCAL_DIR = ".coincidence";

fs::path const & config_dir_user()
{
    static struct ConfigDirUser
    {
        ConfigDirUser()
        {
            char const* xdg_config_home = getenv("XDG_CONFIG_HOME");
            if (xdg_config_home != nullptr) {
                path = fs::path(xdg_config_home);
            }
            if (path.empty()) {
                char const* home = getenv("HOME");
                if (home != nullptr) {
                    path = fs::path(home) / ".config";
                }
            }
            if (!path.empty()) {
                path /= "coincidence";
            } else {
                throw std::runtime_error("Neither XDG_CONFIG_HOME nor HOME is set.");
            }
        }

        fs::path path;
    } config_dir_user;

    return config_dir_user.path;
}

std::string_view path_helper(fs::path& path, std::span<std::string_view const> subpaths, bool is_dir) {
    for (const auto& subpath : subpaths) {
        path /= subpath;
    }
    if (is_dir) {
        fs::create_directories(path);
        path /= "";
    } else if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    return path.native();
}

ptree * find(ptree & root, std::vector<std::string> const& keys)
{
    ptree * node = &root;
    for (auto & key : keys) {
        auto it = node->find(key);
        if (it == node->not_found()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

class ConfigurationImpl {
public:
    ConfigurationImpl(std::span<std::string_view const> subpath, bool user_wide)
    : path_(user_wide ? Configuration::path_user(subpath) : Configuration::path_local(subpath))
    {
        if (!user_wide) {
            std::string path_user(Configuration::path_user(subpath));
            if (fs::exists(path_user)) {
                dflt_locks_.emplace_back(path_user.c_str());
                if (!dflt_locks_.back().try_lock_sharable()) {
                    std::cerr << "Waiting for another process to finish with " << path_user << " ..." << std::endl;
                    dflt_locks_.back().lock_sharable();
                }
                dflts_.emplace_back();
                boost::property_tree::ini_parser::read_ini(path_user, dflts_.back());
            }
        }
        if (fs::exists(path_)) {
            ptree_lock_ = boost::interprocess::file_lock(path_.c_str());
            if (!ptree_lock_.try_lock()) {
                std::cerr << "Waiting for another process to finish with " << path_ << " ..." << std::endl;
                ptree_lock_.lock();
            }
            boost::property_tree::ini_parser::read_ini(path_, ptree_);
        }
    }

    ~ConfigurationImpl() {
        bool changed = false;
        for (auto & [node, hash] : accessed_) {
            if (std::hash<std::string>()(node->data()) != hash) {
                changed = true;
            }
        }
        if (!changed) {
            return;
        }
        // Walk created nodes leaf-first, dropping those that only exist because they were read.
        for (auto it = created_.rbegin(); it != created_.rend(); ++ it) {
            auto [parent, node] = *it;
            auto accessed = accessed_.find(node);
            bool unchanged = accessed != accessed_.end() && std::hash<std::string>()(node->data()) == accessed->second;
            if (node->empty() && (node->data().empty() || unchanged)) {
                for (auto child = parent->begin(); child != parent->end(); ++ child) {
                    if (&child->second == node) {
                        parent->erase(child);
                        break;
                    }
                }
            }
        }
        try {
            boost::property_tree::ini_parser::write_ini(path_, ptree_);
        } catch (boost::property_tree::ini_parser_error const& e) {
            std::cerr << "Failed to write " << path_ << ": " << e.what() << std::endl;
        }
    }

    std::string& operator[](std::span<std::string_view const> locator) {
        std::vector<std::string> keys(locator.begin(), locator.end());
        ptree * value = find(ptree_, keys);
        if (value == nullptr) {
            value = create(keys);
            for (auto & dflt : dflts_) {
                if (ptree * dflt_value = find(dflt, keys)) {
                    value->data() = dflt_value->data();
                    break;
                }
            }
        }
        if (accessed_.find(value) == accessed_.end()) {
            accessed_[value] = std::hash<std::string>()(value->data());
        }
        return value->data();
    }

private:
    ptree * create(std::vector<std::string> const& keys) {
        ptree * node = &ptree_;
        for (auto & key : keys) {
            auto it = node->find(key);
            if (it == node->not_found()) {
                ptree * child = &node->push_back(std::make_pair(key, ptree()))->second;
                created_.emplace_back(node, child);
                node = child;
            } else {
                node = &it->second;
            }
        }
        return node;
    }

    std::string path_;
    ptree ptree_;
    boost::interprocess::file_lock ptree_lock_;
    std::vector<ptree> dflts_;
    std::vector<boost::interprocess::file_lock> dflt_locks_;
    std::vector<std::pair<ptree*, ptree*>> created_;
    std::unordered_map<ptree*, size_t> accessed_;
};

} // namespace

bool Configuration::init() {
    if (has_local()) {
        return false;
    }
    fs::create_directory(LOCAL_DIR);
    return true;
}

Configuration::Configuration(std::span<std::string_view const> subpath, bool user_wide)
    : impl_(reinterpret_cast<void*>(new ConfigurationImpl(subpath, user_wide))) {}

Configuration::~Configuration() {
    delete reinterpret_cast<ConfigurationImpl*>(impl_);
}

std::string& Configuration::operator[](std::span<std::string_view const> locator) {
    return (*reinterpret_cast<ConfigurationImpl*>(impl_))[locator];
}

std::string_view Configuration::path_local(std::span<std::string_view const> subpaths, bool is_dir) {
    fs::path config_dir_local;
    for (
        fs::path path = fs::current_path(), parent_path = path.parent_path();
        !path.empty();
        path = parent_path, parent_path = path.parent_path()
    ) {
        fs::path local_dir = path / LOCAL_DIR;
        if (local_dir == config_dir_user()) {
            break;
        }
        if (fs::is_directory(local_dir)) {
            config_dir_local = local_dir;
            break;
        }
        if (path == parent_path) {
            break;
        }
    }
    if (config_dir_local.empty()) {
        throw std::invalid_argument("Could not find .coincidence directory for project. Create one.");
    }

    static thread_local fs::path path;
    path = config_dir_local;
    return path_helper(path, subpaths, is_dir);
}

std::string_view Configuration::path_user(std::span<std::string_view const> subpaths, bool is_dir) {
    static thread_local fs::path path;
    path = config_dir_user();
    return path_helper(path, subpaths, is_dir);
}

std::string_view Configuration::path_default(std::span<std::string_view const> subpaths, bool is_dir) {
    if (has_local()) {
        return path_local(subpaths, is_dir);
    }
    return path_user(subpaths, is_dir);
}

bool Configuration::has_local() {
    try {
        path_local();
    } catch (std::invalid_argument const&) {
        return false;
    }
    return true;
}

} // namespace coincidence
