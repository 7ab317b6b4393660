#include "dependency_resolver.h"
#include "errors.h"
#include "file_utils.h"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace boxrun {

namespace {

// Top-level modules shipped with CPython 3.12 (sys.stdlib_module_names)
const std::set<std::string> kPythonStdlib = {
    "__future__", "_thread", "abc", "aifc", "argparse", "array", "ast", "asynchat",
    "asyncio", "asyncore", "atexit", "audioop", "base64", "bdb", "binascii", "bisect",
    "builtins", "bz2", "calendar", "cgi", "cgitb", "chunk", "cmath", "cmd", "code",
    "codecs", "codeop", "collections", "colorsys", "compileall", "concurrent",
    "configparser", "contextlib", "contextvars", "copy", "copyreg", "cProfile", "crypt",
    "csv", "ctypes", "curses", "dataclasses", "datetime", "dbm", "decimal", "difflib",
    "dis", "doctest", "email", "encodings", "ensurepip", "enum", "errno", "faulthandler",
    "fcntl", "filecmp", "fileinput", "fnmatch", "fractions", "ftplib", "functools", "gc",
    "getopt", "getpass", "gettext", "glob", "graphlib", "grp", "gzip", "hashlib", "heapq",
    "hmac", "html", "http", "idlelib", "imaplib", "imghdr", "importlib", "inspect", "io",
    "ipaddress", "itertools", "json", "keyword", "lib2to3", "linecache", "locale",
    "logging", "lzma", "mailbox", "mailcap", "marshal", "math", "mimetypes", "mmap",
    "modulefinder", "msvcrt", "multiprocessing", "netrc", "nis", "nntplib", "numbers",
    "operator", "optparse", "os", "ossaudiodev", "pathlib", "pdb", "pickle", "pickletools",
    "pipes", "pkgutil", "platform", "plistlib", "poplib", "posix", "pprint", "profile",
    "pstats", "pty", "pwd", "py_compile", "pyclbr", "pydoc", "queue", "quopri", "random",
    "re", "readline", "reprlib", "resource", "rlcompleter", "runpy", "sched", "secrets",
    "select", "selectors", "shelve", "shlex", "shutil", "signal", "site", "smtplib",
    "sndhdr", "socket", "socketserver", "spwd", "sqlite3", "ssl", "stat", "statistics",
    "string", "stringprep", "struct", "subprocess", "sunau", "symtable", "sys",
    "sysconfig", "syslog", "tabnanny", "tarfile", "telnetlib", "tempfile", "termios",
    "textwrap", "threading", "time", "timeit", "tkinter", "token", "tokenize", "tomllib",
    "trace", "traceback", "tracemalloc", "tty", "turtle", "types", "typing",
    "unicodedata", "unittest", "urllib", "uu", "uuid", "venv", "warnings", "wave",
    "weakref", "webbrowser", "winreg", "winsound", "wsgiref", "xdrlib", "xml", "xmlrpc",
    "zipapp", "zipfile", "zipimport", "zlib", "zoneinfo",
};

// Import names whose distribution is published under another name
const std::map<std::string, std::string> kPythonDistributions = {
    {"PIL", "Pillow"},
    {"cv2", "opencv-python"},
    {"sklearn", "scikit-learn"},
    {"skimage", "scikit-image"},
    {"yaml", "PyYAML"},
    {"bs4", "beautifulsoup4"},
    {"dateutil", "python-dateutil"},
    {"dotenv", "python-dotenv"},
    {"docx", "python-docx"},
    {"pptx", "python-pptx"},
    {"magic", "python-magic"},
    {"serial", "pyserial"},
    {"usb", "pyusb"},
    {"zmq", "pyzmq"},
    {"jwt", "PyJWT"},
    {"Crypto", "pycryptodome"},
    {"OpenSSL", "pyOpenSSL"},
    {"fitz", "PyMuPDF"},
    {"git", "GitPython"},
    {"attr", "attrs"},
    {"MySQLdb", "mysqlclient"},
    {"psycopg2", "psycopg2-binary"},
};

// Module name of the staged source file itself
const std::set<std::string> kPythonLocalModules = {"main"};

const std::set<std::string> kNodeBuiltins = {
    "assert", "async_hooks", "buffer", "bun", "child_process", "cluster", "console",
    "constants", "crypto", "dgram", "diagnostics_channel", "dns", "domain", "events",
    "fs", "http", "http2", "https", "inspector", "module", "net", "os", "path",
    "perf_hooks", "process", "punycode", "querystring", "readline", "repl", "stream",
    "string_decoder", "sys", "test", "timers", "tls", "trace_events", "tty", "url",
    "util", "v8", "vm", "wasi", "worker_threads", "zlib",
};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream stream(s);
    while (std::getline(stream, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines = split(text, '\n');
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
    }
    return lines;
}

bool is_python_identifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name[0]))) {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

// Collect a Python top-level module into `out` unless it is stdlib or local
void add_python_module(const std::string& dotted, std::vector<std::string>& out) {
    std::string top = dotted.substr(0, dotted.find('.'));
    if (!is_python_identifier(top)) {
        return;
    }
    if (kPythonStdlib.count(top) || kPythonLocalModules.count(top)) {
        return;
    }
    auto dist = kPythonDistributions.find(top);
    std::string package = dist != kPythonDistributions.end() ? dist->second : top;
    if (std::find(out.begin(), out.end(), package) == out.end()) {
        out.push_back(package);
    }
}

// Package portion of a bare module specifier ("@scope/pkg/sub" -> "@scope/pkg")
std::string node_package_name(const std::string& specifier) {
    auto parts = split(specifier, '/');
    if (parts.empty()) {
        return "";
    }
    if (specifier[0] == '@') {
        return parts.size() >= 2 ? parts[0] + "/" + parts[1] : "";
    }
    return parts[0];
}

std::string strip_line_comment(const std::string& line, const std::string& marker) {
    size_t pos = line.find(marker);
    return pos == std::string::npos ? line : line.substr(0, pos);
}

} // namespace

// DependencySet

DependencySet::DependencySet(std::initializer_list<std::string> specifiers) {
    for (const auto& specifier : specifiers) {
        add(specifier);
    }
}

bool DependencySet::add(const std::string& specifier) {
    if (!seen_.insert(specifier).second) {
        return false;
    }
    items_.push_back(specifier);
    return true;
}

// DependencyResolver

DependencyResolver::DependencyResolver(const RuntimeProfile& profile) : profile_(profile) {}

std::vector<std::string> DependencyResolver::parse_requirement_markers(
    const std::string& text,
    const std::string& comment_prefix
) {
    std::vector<std::string> specifiers;
    if (comment_prefix.empty()) {
        return specifiers;
    }

    for (const auto& raw : split_lines(text)) {
        std::string line = trim(raw);
        if (!starts_with(line, comment_prefix)) {
            continue;
        }
        std::string body = trim(line.substr(comment_prefix.size()));
        const std::string marker = "requirements:";
        if (!starts_with(body, marker)) {
            continue;
        }
        for (const auto& item : split(body.substr(marker.size()), ',')) {
            std::string spec = trim(item);
            if (!spec.empty()) {
                specifiers.push_back(spec);
            }
        }
    }
    return specifiers;
}

std::vector<std::string> DependencyResolver::parse_python_imports(const std::string& code) {
    static const std::regex import_re(R"(^import\s+(.+)$)");
    static const std::regex from_re(R"(^from\s+(\S+)\s+import\b.*$)");

    std::vector<std::string> packages;
    std::string open_quote;  // Delimiter of the triple-quoted string we are inside

    for (const auto& raw : split_lines(code)) {
        std::string line = trim(raw);

        if (!open_quote.empty()) {
            if (line.find(open_quote) != std::string::npos) {
                open_quote.clear();
            }
            continue;
        }
        for (const char* quote : {"\"\"\"", "'''"}) {
            if (starts_with(line, quote)) {
                // Opened and not closed on the same line
                if (line.find(quote, 3) == std::string::npos) {
                    open_quote = quote;
                }
                break;
            }
        }
        if (!open_quote.empty() || starts_with(line, "\"\"\"") || starts_with(line, "'''")) {
            continue;
        }

        line = strip_line_comment(line, "#");
        for (const auto& piece : split(line, ';')) {
            std::string statement = trim(piece);
            std::smatch match;
            if (std::regex_match(statement, match, import_re)) {
                for (const auto& item : split(match[1].str(), ',')) {
                    std::string name = trim(item);
                    name = name.substr(0, name.find_first_of(" \t"));
                    add_python_module(name, packages);
                }
            } else if (std::regex_match(statement, match, from_re)) {
                std::string module = match[1].str();
                if (!starts_with(module, ".")) {
                    add_python_module(module, packages);
                }
            }
        }
    }
    return packages;
}

std::vector<std::string> DependencyResolver::parse_node_imports(const std::string& code) {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(require\s*\(\s*['"]([^'"]+)['"]\s*\))"),
        std::regex(R"((?:import|export)\s+(?:[\w*{}\s,$]+\s+from\s+)?['"]([^'"]+)['"])"),
        std::regex(R"(import\s*\(\s*['"]([^'"]+)['"]\s*\))"),
    };

    // Keep source order across the three patterns
    std::map<size_t, std::string> found;
    for (const auto& pattern : patterns) {
        for (auto it = std::sregex_iterator(code.begin(), code.end(), pattern);
             it != std::sregex_iterator(); ++it) {
            found.emplace(static_cast<size_t>(it->position(1)), (*it)[1].str());
        }
    }

    std::vector<std::string> packages;
    for (const auto& entry : found) {
        const std::string& specifier = entry.second;
        if (starts_with(specifier, ".") || starts_with(specifier, "/") ||
            starts_with(specifier, "node:") || starts_with(specifier, "bun:")) {
            continue;
        }
        std::string package = node_package_name(specifier);
        if (package.empty() || kNodeBuiltins.count(package)) {
            continue;
        }
        if (std::find(packages.begin(), packages.end(), package) == packages.end()) {
            packages.push_back(package);
        }
    }
    return packages;
}

std::vector<std::string> DependencyResolver::parse_go_imports(const std::string& code) {
    static const std::regex quoted_re(R"re("([^"]+)")re");

    std::vector<std::string> packages;
    auto consider = [&packages](const std::string& line) {
        std::smatch match;
        if (!std::regex_search(line, match, quoted_re)) {
            return;
        }
        std::string path = match[1].str();
        std::string first = path.substr(0, path.find('/'));
        // Standard library paths never contain a dot in their first element
        if (first.find('.') == std::string::npos) {
            return;
        }
        if (std::find(packages.begin(), packages.end(), path) == packages.end()) {
            packages.push_back(path);
        }
    };

    bool in_block = false;
    for (const auto& raw : split_lines(code)) {
        std::string line = trim(strip_line_comment(raw, "//"));
        if (in_block) {
            if (starts_with(line, ")")) {
                in_block = false;
            } else {
                consider(line);
            }
            continue;
        }
        if (!starts_with(line, "import")) {
            continue;
        }
        std::string rest = trim(line.substr(6));
        if (starts_with(rest, "(")) {
            rest = trim(rest.substr(1));
            size_t close = rest.find(')');
            if (close == std::string::npos) {
                in_block = true;
            } else {
                rest = rest.substr(0, close);
            }
            consider(rest);
        } else if (line.size() > 6 && std::isspace(static_cast<unsigned char>(line[6]))) {
            consider(rest);
        }
    }
    return packages;
}

std::string DependencyResolver::requirement_name(const std::string& specifier) {
    std::string spec = trim(specifier);
    size_t end;
    if (starts_with(spec, "@")) {
        end = spec.find('@', 1);
    } else {
        end = spec.find_first_of("=<>!~;[ @(");
    }
    std::string name = spec.substr(0, end);

    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        if (c == '_' || c == '.') {
            return '-';
        }
        return static_cast<char>(std::tolower(c));
    });
    return name;
}

std::vector<std::string> DependencyResolver::merge_requirements(
    const std::vector<std::string>& existing,
    const std::vector<std::string>& discovered
) {
    std::vector<std::string> merged;
    std::set<std::string> names;

    for (const auto& entry : existing) {
        std::string spec = trim(entry);
        if (spec.empty()) {
            continue;
        }
        merged.push_back(spec);
        names.insert(requirement_name(spec));
    }

    for (const auto& entry : discovered) {
        std::string spec = trim(entry);
        if (spec.empty()) {
            continue;
        }
        if (names.insert(requirement_name(spec)).second) {
            merged.push_back(spec);
        }
    }
    return merged;
}

std::vector<std::string> DependencyResolver::parse_manifest_entries(const std::string& content) {
    std::vector<std::string> entries;
    for (const auto& raw : split_lines(content)) {
        std::string line = raw;
        size_t comment = line.find(" #");
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = trim(line);
        // Skip comments and pip options such as "-r other.txt" or "--index-url"
        if (line.empty() || line[0] == '#' || line[0] == '-') {
            continue;
        }
        entries.push_back(line);
    }
    return entries;
}

std::vector<std::string> DependencyResolver::infer_imports(const std::string& code) const {
    switch (profile_.import_syntax) {
        case ImportSyntax::PYTHON: return parse_python_imports(code);
        case ImportSyntax::NODE: return parse_node_imports(code);
        case ImportSyntax::GO: return parse_go_imports(code);
        case ImportSyntax::NONE: break;
    }
    return {};
}

DependencySet DependencyResolver::resolve_source(const std::string& code) const {
    // Explicit markers win over inferred imports of the same package
    auto merged = merge_requirements(
        parse_requirement_markers(code, profile_.comment_prefix),
        infer_imports(code));

    DependencySet packages;
    for (const auto& spec : merged) {
        packages.add(spec);
    }
    return packages;
}

std::vector<std::string> DependencyResolver::scan_markers(const fs::path& root) const {
    std::string wanted_ext = "." + profile_.extension;
    std::transform(wanted_ext.begin(), wanted_ext.end(), wanted_ext.begin(), ::tolower);

    std::vector<fs::path> sources;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw SandboxError(ErrorKind::SCAN_FAILED,
                           "failed to scan project files in " + root.string() + ": " + ec.message());
    }
    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            std::cerr << "[Resolver] Warning: stopped walking " << root
                      << ": " << ec.message() << std::endl;
            break;
        }
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) {
            continue;
        }
        std::string ext = it->path().extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
        if (ext == wanted_ext) {
            sources.push_back(it->path());
        }
    }
    std::sort(sources.begin(), sources.end());

    std::vector<std::string> discovered;
    for (const auto& source : sources) {
        std::string content;
        if (!FileUtils::read_file(source.string(), content)) {
            std::cerr << "[Resolver] Warning: failed to read file " << source << std::endl;
            continue;
        }
        for (const auto& spec : parse_requirement_markers(content, profile_.comment_prefix)) {
            if (std::find(discovered.begin(), discovered.end(), spec) == discovered.end()) {
                discovered.push_back(spec);
            }
        }
    }
    return discovered;
}

DependencyResolution DependencyResolver::resolve_project(const fs::path& project_dir) const {
    std::error_code ec;
    if (!fs::is_directory(project_dir, ec)) {
        throw SandboxError(ErrorKind::SCAN_FAILED,
                           "project directory does not exist: " + project_dir.string());
    }
    fs::directory_iterator probe(project_dir, ec);
    if (ec) {
        throw SandboxError(ErrorKind::SCAN_FAILED,
                           "cannot read project directory " + project_dir.string() + ": " + ec.message());
    }

    DependencyResolution resolution;

    std::string found;
    for (const auto& rule : profile_.manifests) {
        if (fs::is_regular_file(project_dir / rule.filename, ec)) {
            found = rule.filename;
            break;
        }
    }

    // The canonical manifest is authoritative as-is
    if (!found.empty() && found == profile_.canonical_manifest) {
        std::string content;
        if (FileUtils::read_file((project_dir / found).string(), content)) {
            for (const auto& entry : parse_manifest_entries(content)) {
                resolution.packages.add(entry);
            }
        } else {
            std::cerr << "[Resolver] Warning: failed to read " << found << std::endl;
        }
        resolution.manifest = found;
        std::cerr << "[Resolver] Using existing " << found << " ("
                  << resolution.packages.size() << " entries)" << std::endl;
        return resolution;
    }

    auto discovered = scan_markers(project_dir);
    if (discovered.empty()) {
        resolution.manifest = found;
        return resolution;
    }

    if (!profile_.canonical_manifest.empty()) {
        fs::path manifest_path = project_dir / profile_.canonical_manifest;

        std::vector<std::string> existing;
        std::string content;
        if (fs::exists(manifest_path, ec) && FileUtils::read_file(manifest_path.string(), content)) {
            existing = parse_manifest_entries(content);
        }

        auto merged = merge_requirements(existing, discovered);
        std::ostringstream out;
        for (const auto& spec : merged) {
            out << spec << "\n";
        }

        if (FileUtils::write_file(manifest_path.string(), out.str())) {
            for (const auto& spec : merged) {
                resolution.packages.add(spec);
            }
            resolution.manifest = profile_.canonical_manifest;
            resolution.materialized = true;
            std::cerr << "[Resolver] Created " << profile_.canonical_manifest
                      << " from requirements comments (" << merged.size() << " entries)" << std::endl;
            return resolution;
        }
        std::cerr << "[Resolver] Warning: failed to write " << manifest_path << std::endl;
    }

    if (!found.empty()) {
        resolution.manifest = found;
        return resolution;
    }

    for (const auto& spec : discovered) {
        resolution.packages.add(spec);
    }
    return resolution;
}

} // namespace boxrun
