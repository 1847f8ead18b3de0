#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace CIP {

// EN: Raised when a child process cannot be created or waited for.
// FR: Levée quand un processus enfant ne peut être créé ou attendu.
class ProcessError : public std::runtime_error {
public:
    explicit ProcessError(const std::string& message) : std::runtime_error(message) {}
};

// EN: How a child process ended.
// FR: Comment un processus enfant s'est terminé.
enum class ProcessOutcome {
    EXITED,      // EN: Normal exit / FR: Sortie normale
    SIGNALED,    // EN: Killed by a signal it did not expect / FR: Tué par un signal inattendu
    TIMED_OUT,   // EN: Killed after its timeout / FR: Tué après son timeout
    CANCELLED    // EN: Killed because the run was cancelled / FR: Tué car l'exécution a été annulée
};

// EN: Description of a shell command to run.
// FR: Description d'une commande shell à exécuter.
struct ProcessSpec {
    std::string command;
    std::filesystem::path working_directory;
    std::vector<std::pair<std::string, std::string>> environment; // EN: Added to the parent's / FR: Ajouté à celui du parent
    std::filesystem::path log_path;                                // EN: stdout + stderr / FR: stdout + stderr
    std::optional<std::chrono::milliseconds> timeout;
    std::chrono::milliseconds kill_grace{5000};
};

struct ProcessResult {
    int exit_code = -1;            // EN: Exit status, or 128 + signal / FR: Code de sortie, ou 128 + signal
    ProcessOutcome outcome = ProcessOutcome::EXITED;
    int term_signal = 0;
    std::chrono::milliseconds duration{0};

    bool succeeded() const { return outcome == ProcessOutcome::EXITED && exit_code == 0; }
};

// EN: Runs `/bin/sh -c <command>` in its own process group with output redirected to a log file.
// FR: Exécute `/bin/sh -c <commande>` dans son propre groupe de processus avec sortie redirigée vers un log.
class ProcessRunner {
public:
    using CancelPredicate = std::function<bool()>;

    explicit ProcessRunner(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(50));

    // EN: Run to completion. Throws ProcessError when the process cannot be started.
    // FR: Exécute jusqu'à la fin. Lance ProcessError si le processus ne peut démarrer.
    ProcessResult run(const ProcessSpec& spec, const CancelPredicate& should_cancel = {}) const;

    static std::string outcomeToString(ProcessOutcome outcome);

    // EN: SIGKILL the child's process group, then wait for the child itself
    // FR: SIGKILL sur le groupe de l'enfant, puis attend l'enfant lui-même
    static void killAndReap(pid_t pid);

private:
    // EN: Build "KEY=VALUE" entries from the parent environment plus overrides.
    // FR: Construit les entrées "CLE=VALEUR" depuis l'environnement parent plus les surcharges.
    static std::vector<std::string> buildEnvironment(
        const std::vector<std::pair<std::string, std::string>>& overrides);

    std::chrono::milliseconds poll_interval_;
};

} // namespace CIP
