#include "engine/LanguageCensus.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "core/TreeWalker.hpp"
#include "engine/BinaryClassifier.hpp"
#include "util/Logger.hpp"

namespace gitpulse {

namespace {
    const std::unordered_map<std::string, std::string>& extensionTable() {
        static const std::unordered_map<std::string, std::string> table = {
            {"ts", "TypeScript"}, {"tsx", "TypeScript"},
            {"js", "JavaScript"}, {"jsx", "JavaScript"}, {"mjs", "JavaScript"}, {"cjs", "JavaScript"},
            {"py", "Python"}, {"pyw", "Python"},
            {"rs", "Rust"},
            {"go", "Go"},
            {"java", "Java"},
            {"kt", "Kotlin"}, {"kts", "Kotlin"},
            {"swift", "Swift"},
            {"rb", "Ruby"},
            {"php", "PHP"},
            {"cs", "C#"},
            {"cpp", "C++"}, {"cc", "C++"}, {"cxx", "C++"}, {"hpp", "C++"},
            {"c", "C"}, {"h", "C"},
            {"scala", "Scala"},
            {"hs", "Haskell"},
            {"ex", "Elixir"}, {"exs", "Elixir"},
            {"erl", "Erlang"},
            {"clj", "Clojure"}, {"cljs", "Clojure"},
            {"dart", "Dart"},
            {"lua", "Lua"},
            {"r", "R"},
            {"m", "Objective-C"}, {"mm", "Objective-C"},
            {"pl", "Perl"}, {"pm", "Perl"},
            {"sh", "Shell"}, {"bash", "Shell"}, {"zsh", "Shell"},
            {"html", "HTML"}, {"htm", "HTML"},
            {"css", "CSS"}, {"scss", "CSS"}, {"sass", "CSS"}, {"less", "CSS"},
            {"vue", "Vue"},
            {"svelte", "Svelte"},
            {"sql", "SQL"},
            {"md", "Markdown"}, {"mdx", "Markdown"},
            {"json", "JSON"},
            {"yaml", "YAML"}, {"yml", "YAML"},
            {"xml", "XML"},
            {"toml", "TOML"},
            {"zig", "Zig"},
            {"nim", "Nim"},
            {"v", "V"},
            {"jl", "Julia"},
        };
        return table;
    }
}

std::string LanguageCensus::languageForPath(const std::string& path) {
    size_t slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) return std::string();

    std::string ext = name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = extensionTable().find(ext);
    return it == extensionTable().end() ? std::string() : it->second;
}

std::map<std::string, int64_t> LanguageCensus::computeLanguages(const std::vector<std::string>& paths) {
    std::map<std::string, int64_t> languages;
    for (const auto& path : paths) {
        std::string language = languageForPath(path);
        if (!language.empty()) {
            ++languages[language];
        }
    }
    return languages;
}

Expected<CensusResult> LanguageCensus::run(const std::string& treeId) const {
    CensusResult result;
    std::vector<std::string> paths;

    TreeWalker walker(store);
    auto walked = walker.walkTree(treeId, [&](const std::string& path, const TreeEntry& entry) {
        paths.push_back(path);
        ++result.fileCount;
        std::string content;
        try {
            content = store.readBlob(entry.hashHex);
        } catch (const ObjectStoreError& e) {
            ++result.skippedFiles;
            Logger::instance().debug("Census skipping " + path + ": " + e.what());
            return;
        }
        if (BinaryClassifier::isBinary(content)) {
            ++result.binaryFileCount;
        } else {
            result.totalLinesOfCode += BinaryClassifier::countLines(content);
        }
    });
    if (!walked) return walked.error();

    result.languages = computeLanguages(paths);
    return result;
}

}
