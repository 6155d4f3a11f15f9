#pragma once

#include <optional>
#include <string>

// Converts menu accelerators written as "CmdOrCtrl+Shift+S" into the GTK
// accelerator syntax ("<Primary><Shift>s") used by set_accels_for_action().
// Returns nullopt for combos that cannot be parsed.
std::optional<std::string> to_gtk_accelerator(const std::string& combo);

// GTK menu labels read '_' as a mnemonic marker; doubling it shows it literally
std::string escape_mnemonic(const std::string& label);
