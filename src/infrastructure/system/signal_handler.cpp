// EN: Implementation of the SignalHandler class. Records SIGINT/SIGTERM for the run loop to act upon.
// FR: Implémentation de la classe SignalHandler. Enregistre SIGINT/SIGTERM pour la boucle d'exécution.

#include "infrastructure/system/signal_handler.hpp"
#include "infrastructure/logging/logger.hpp"
#include <cstring>
#include <stdexcept>
#include <signal.h>

namespace CIP {

std::atomic<bool> SignalHandler::shutdown_requested_{false};
std::atomic<int> SignalHandler::last_signal_{0};

SignalHandler& SignalHandler::getInstance() {
    static SignalHandler instance;
    return instance;
}

SignalHandler::SignalHandler() = default;

SignalHandler::~SignalHandler() {
    if (initialized_) {
        std::signal(SIGINT, SIG_DFL);
        std::signal(SIGTERM, SIG_DFL);
    }
}

// EN: Initialize signal handling by registering SIGINT and SIGTERM handlers.
// FR: Initialise la gestion des signaux en enregistrant les handlers SIGINT et SIGTERM.
void SignalHandler::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_.load()) {
        LOG_DEBUG("signal_handler", "SignalHandler already initialized");
        return;
    }

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &SignalHandler::signalCallback;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &action, nullptr) != 0) {
        LOG_ERROR("signal_handler", "Failed to register SIGINT handler");
        throw std::runtime_error("Failed to register SIGINT handler");
    }

    if (sigaction(SIGTERM, &action, nullptr) != 0) {
        LOG_ERROR("signal_handler", "Failed to register SIGTERM handler");
        // EN: Restore SIGINT handler before throwing
        // FR: Restaure le handler SIGINT avant de lancer l'exception
        std::signal(SIGINT, SIG_DFL);
        throw std::runtime_error("Failed to register SIGTERM handler");
    }

    initialized_ = true;
    LOG_DEBUG("signal_handler", "SIGINT and SIGTERM handlers registered");
}

void SignalHandler::restore() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_.exchange(false)) {
        return;
    }
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

void SignalHandler::triggerShutdown(int signal_number) {
    signalCallback(signal_number);
}

bool SignalHandler::isShutdownRequested() const {
    return shutdown_requested_.load();
}

int SignalHandler::lastSignal() const {
    return last_signal_.load();
}

void SignalHandler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_requested_ = false;
    last_signal_ = 0;
}

// EN: Only lock-free atomics are touched here.
// FR: Seuls des atomiques sans verrou sont touchés ici.
void SignalHandler::signalCallback(int signal_number) {
    last_signal_.store(signal_number);
    shutdown_requested_.store(true);
}

} // namespace CIP
