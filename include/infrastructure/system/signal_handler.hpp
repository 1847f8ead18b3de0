// EN: Signal Handler for CI-Pipeline - turns SIGINT/SIGTERM into a polled cancellation request
// FR: Gestionnaire de signaux pour CI-Pipeline - transforme SIGINT/SIGTERM en demande d'annulation interrogée

#pragma once

#include <atomic>
#include <csignal>
#include <mutex>

namespace CIP {

// EN: Singleton signal handler. The OS handler only stores a flag and the signal number;
//     the run loop polls isShutdownRequested() and cancels the engine itself.
// FR: Gestionnaire de signaux singleton. Le handler OS ne stocke qu'un flag et le numéro du signal ;
//     la boucle d'exécution interroge isShutdownRequested() et annule le moteur elle-même.
class SignalHandler {
public:
    static SignalHandler& getInstance();

    // EN: Initialize signal handling (registers SIGINT, SIGTERM handlers)
    // FR: Initialise la gestion des signaux (enregistre les handlers SIGINT, SIGTERM)
    void initialize();

    // EN: Restore the default dispositions
    // FR: Restaure les dispositions par défaut
    void restore();

    // EN: Manually trigger a shutdown request (useful for testing)
    // FR: Déclenche manuellement une demande d'arrêt (utile pour les tests)
    void triggerShutdown(int signal_number = SIGTERM);

    bool isShutdownRequested() const;

    // EN: Signal number that requested shutdown, 0 if none
    // FR: Numéro du signal ayant demandé l'arrêt, 0 si aucun
    int lastSignal() const;

    // EN: Reset the signal handler (mainly for testing)
    // FR: Remet à zéro le gestionnaire de signaux (principalement pour les tests)
    void reset();

    bool isInitialized() const { return initialized_.load(); }

    ~SignalHandler();

private:
    SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;
    SignalHandler(SignalHandler&&) = delete;
    SignalHandler& operator=(SignalHandler&&) = delete;

    // EN: Static signal handler function (C-style callback, async-signal-safe)
    // FR: Fonction gestionnaire de signaux statique (callback style C, async-signal-safe)
    static void signalCallback(int signal_number);

    mutable std::mutex mutex_;
    std::atomic<bool> initialized_{false};

    static std::atomic<bool> shutdown_requested_;
    static std::atomic<int> last_signal_;
};

} // namespace CIP
