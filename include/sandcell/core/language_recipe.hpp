/**
 * @file language_recipe.hpp
 * @brief Closed table of supported languages and their invocation recipes
 *
 * Each supported language is one LanguageRecipe entry: where its interpreter
 * usually lives, which packages provide it, how submitted source is staged
 * and invoked. Adding a language means adding an enum value and a table row.
 *
 * **Execution Layout inside the Container**:
 * ```
 * <working_dir>/.sandcell-run-<n>/
 *   ├─ main.<ext>   (submitted source, written from stdin)
 *   ├─ wrapper      (pid of the staging shell)
 *   ├─ pid          (interpreter pid, also its process group id)
 *   └─ cancelled    (written by the kill helper; nothing launches after it)
 * ```
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sandcell {
namespace core {

/**
 * @enum Language
 * @brief Supported source languages
 */
enum class Language {
    PYTHON,      ///< CPython 3
    JAVASCRIPT,  ///< Node.js
    SHELL        ///< POSIX sh
};

/**
 * @struct LanguageRecipe
 * @brief How to find, install and invoke one language's interpreter
 */
struct LanguageRecipe {
    Language language;                                ///< Enum tag
    std::string name;                                 ///< Canonical name ("python")
    std::vector<std::string> aliases;                 ///< Accepted alternate names
    std::vector<std::string> interpreter_candidates;  ///< Absolute paths, then names for PATH lookup
    std::vector<std::string> interpreter_args;        ///< Arguments placed before the source file
    std::string source_file;                          ///< File name the source is staged as
    std::vector<std::string> version_args;            ///< Version probe arguments (empty = none)
    std::vector<std::string> apk_packages;            ///< Alpine packages providing the interpreter
    std::vector<std::string> apt_packages;            ///< Debian/Ubuntu packages providing the interpreter
};

/// Exit code reported by the run launcher when the source cannot be staged
constexpr int kStagingFailedExitCode = 125;

/**
 * @brief All recipes, one per Language value
 */
const std::vector<LanguageRecipe>& LanguageTable();

/**
 * @brief Recipe for a language
 */
const LanguageRecipe& GetRecipe(Language language);

/**
 * @brief Resolve a language name or alias (case-insensitive)
 * @return Language, or nullopt if the name is not in the table
 */
std::optional<Language> ParseLanguage(const std::string& name);

/**
 * @brief Canonical name of a language
 */
const std::string& LanguageName(Language language);

/**
 * @brief Whether the recipe knows how to install its interpreter
 */
bool CanBootstrap(const LanguageRecipe& recipe);

/***************************************************************************
 * In-container command construction
 ***************************************************************************/

/**
 * @brief Command printing the first available interpreter path (exit 1 if none)
 */
std::vector<std::string> BuildProbeCommand(const LanguageRecipe& recipe);

/**
 * @brief Command installing the recipe's packages with apk or apt-get
 *
 * Exits 127 when the image has neither package manager.
 */
std::vector<std::string> BuildBootstrapCommand(const LanguageRecipe& recipe);

/**
 * @brief Command running the interpreter with its version arguments
 * @return Empty vector if the recipe has no version probe
 */
std::vector<std::string> BuildVersionCommand(const LanguageRecipe& recipe,
                                             const std::string& interpreter_path);

/**
 * @brief Command that stages stdin as the source file and runs it
 *
 * The interpreter runs as its own process group and its pid is recorded in
 * `<run_dir>/pid` so BuildKillCommand can terminate it and its descendants.
 * The run directory is removed when the interpreter exits; the command exits
 * with the interpreter's exit code, kStagingFailedExitCode if the source
 * cannot be written, or 137 if the run was cancelled before launch.
 */
std::vector<std::string> BuildRunCommand(const LanguageRecipe& recipe,
                                         const std::string& interpreter_path,
                                         const std::string& run_dir);

/**
 * @brief Command cancelling a run started by BuildRunCommand
 *
 * Marks the run cancelled, then kills the interpreter's process group, or the
 * staging shell if the interpreter has not been launched yet. Works before
 * the run command has even started. Exits 0 once nothing of the run is
 * alive, 1 if something survives the kill.
 */
std::vector<std::string> BuildKillCommand(const std::string& run_dir);

} // namespace core
} // namespace sandcell
