/**
 * @file language_recipe.cpp
 * @brief Language table and in-container helper scripts
 *
 * The helper scripts are passed to `sh -c` as a fixed program text with
 * positional parameters; submitted code only ever travels through stdin,
 * never through the command line.
 *
 * @date 2025
 */

#include "sandcell/core/language_recipe.hpp"
#include "sandcell/utils/string_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace sandcell {
namespace core {

using utils::StringUtils;

namespace {

// $1 = run dir, $2 = source file name, $3.. = interpreter and its arguments.
// The launcher publishes its pid before checking the cancel marker and the
// kill helper writes the marker before reading the pid, so one of them always
// sees the other.
constexpr const char* kRunScript = R"(d=$1; f=$2; shift 2
mkdir -p "$d" && echo "$$" > "$d/wrapper" || exit 125
[ -f "$d/cancelled" ] && { rm -rf "$d"; exit 137; }
cat > "$d/$f" || exit 125
s=; command -v setsid >/dev/null 2>&1 && s=setsid
$s /bin/sh -c 'echo "$$" > "$1/pid.tmp" && mv "$1/pid.tmp" "$1/pid" || exit 125
[ -f "$1/cancelled" ] && exit 137
shift; exec "$@"' sandcell-launch "$d" "$@" "$d/$f" &
p=$!
wait "$p"
rc=$?
rm -rf "$d"
exit "$rc")";

// $1 = run dir. Exits 1 if the run is still alive after the kill.
constexpr const char* kKillScript = R"(d=$1
mkdir -p "$d" && : > "$d/cancelled" || exit 1
p=$(cat "$d/pid" 2>/dev/null)
w=
if [ -n "$p" ]; then
  kill -s KILL -- "-$p" 2>/dev/null
  kill -s KILL "$p" 2>/dev/null
else
  w=$(cat "$d/wrapper" 2>/dev/null)
  [ -n "$w" ] && kill -s KILL "$w" 2>/dev/null
fi
i=0
while { [ -n "$p" ] && { kill -0 -- "-$p" 2>/dev/null || kill -0 "$p" 2>/dev/null; }; } ||
      { [ -n "$w" ] && kill -0 "$w" 2>/dev/null; }; do
  i=$((i + 1))
  if [ "$i" -gt 50 ]; then echo "run still alive after kill" >&2; exit 1; fi
  sleep 0.1
done
for e in "$d"/*; do [ "$e" = "$d/cancelled" ] || rm -rf "$e"; done
exit 0)";

// $@ = candidates; absolute paths are tested directly, names go through PATH
constexpr const char* kProbeScript = R"(for c in "$@"; do
  case "$c" in
    /*) if [ -x "$c" ]; then echo "$c"; exit 0; fi ;;
    *) p=$(command -v "$c" 2>/dev/null) && [ -n "$p" ] && { echo "$p"; exit 0; } ;;
  esac
done
exit 1)";

// $1 = apk packages, $2 = apt packages (space separated, split on purpose)
constexpr const char* kBootstrapScript = R"(if command -v apk >/dev/null 2>&1 && [ -n "$1" ]; then
  apk update && apk add --no-cache $1
elif command -v apt-get >/dev/null 2>&1 && [ -n "$2" ]; then
  apt-get update && DEBIAN_FRONTEND=noninteractive apt-get install -y --no-install-recommends $2
else
  echo "no supported package manager for this image" >&2
  exit 127
fi)";

std::vector<LanguageRecipe> MakeTable() {
    std::vector<LanguageRecipe> table;

    LanguageRecipe python;
    python.language = Language::PYTHON;
    python.name = "python";
    python.aliases = {"python3", "py"};
    python.interpreter_candidates = {"/usr/bin/python3", "/usr/local/bin/python3",
                                     "/usr/bin/python", "/usr/local/bin/python",
                                     "python3", "python"};
    python.source_file = "main.py";
    python.version_args = {"--version"};
    python.apk_packages = {"python3"};
    python.apt_packages = {"python3"};
    table.push_back(python);

    LanguageRecipe javascript;
    javascript.language = Language::JAVASCRIPT;
    javascript.name = "javascript";
    javascript.aliases = {"js", "node", "nodejs"};
    javascript.interpreter_candidates = {"/usr/bin/node", "/usr/local/bin/node", "node", "nodejs"};
    javascript.source_file = "main.js";
    javascript.version_args = {"--version"};
    javascript.apk_packages = {"nodejs"};
    javascript.apt_packages = {"nodejs"};
    table.push_back(javascript);

    LanguageRecipe shell;
    shell.language = Language::SHELL;
    shell.name = "shell";
    shell.aliases = {"sh"};
    shell.interpreter_candidates = {"/bin/sh"};
    shell.source_file = "main.sh";
    table.push_back(shell);

    return table;
}

} // anonymous namespace

// ============================================================================
// LANGUAGE TABLE
// ============================================================================

const std::vector<LanguageRecipe>& LanguageTable() {
    static const std::vector<LanguageRecipe> table = MakeTable();
    return table;
}

const LanguageRecipe& GetRecipe(Language language) {
    for (const auto& recipe : LanguageTable()) {
        if (recipe.language == language) {
            return recipe;
        }
    }
    throw std::logic_error("language missing from recipe table");
}

std::optional<Language> ParseLanguage(const std::string& name) {
    std::string key = StringUtils::ToLower(StringUtils::Trim(name));

    for (const auto& recipe : LanguageTable()) {
        if (recipe.name == key ||
            std::find(recipe.aliases.begin(), recipe.aliases.end(), key) != recipe.aliases.end()) {
            return recipe.language;
        }
    }
    return std::nullopt;
}

const std::string& LanguageName(Language language) {
    return GetRecipe(language).name;
}

bool CanBootstrap(const LanguageRecipe& recipe) {
    return !recipe.apk_packages.empty() || !recipe.apt_packages.empty();
}

// ============================================================================
// COMMAND CONSTRUCTION
// ============================================================================

std::vector<std::string> BuildProbeCommand(const LanguageRecipe& recipe) {
    std::vector<std::string> command = {"/bin/sh", "-c", kProbeScript, "sandcell-probe"};
    command.insert(command.end(), recipe.interpreter_candidates.begin(),
                   recipe.interpreter_candidates.end());
    return command;
}

std::vector<std::string> BuildBootstrapCommand(const LanguageRecipe& recipe) {
    return {"/bin/sh", "-c", kBootstrapScript, "sandcell-bootstrap",
            StringUtils::Join(recipe.apk_packages, " "),
            StringUtils::Join(recipe.apt_packages, " ")};
}

std::vector<std::string> BuildVersionCommand(const LanguageRecipe& recipe,
                                             const std::string& interpreter_path) {
    if (recipe.version_args.empty()) {
        return {};
    }
    std::vector<std::string> command = {interpreter_path};
    command.insert(command.end(), recipe.version_args.begin(), recipe.version_args.end());
    return command;
}

std::vector<std::string> BuildRunCommand(const LanguageRecipe& recipe,
                                         const std::string& interpreter_path,
                                         const std::string& run_dir) {
    std::vector<std::string> command = {"/bin/sh", "-c", kRunScript, "sandcell-run",
                                        run_dir, recipe.source_file, interpreter_path};
    command.insert(command.end(), recipe.interpreter_args.begin(), recipe.interpreter_args.end());
    return command;
}

std::vector<std::string> BuildKillCommand(const std::string& run_dir) {
    return {"/bin/sh", "-c", kKillScript, "sandcell-kill", run_dir};
}

} // namespace core
} // namespace sandcell
