#include "sandbox/sandbox.hpp"

#include <utility>

#include "glog/logging.h"

namespace sandbox {

std::vector<Sandbox::Entry>* Sandbox::Registry() {
  static auto* registry = new std::vector<Entry>;
  return registry;
}

void Sandbox::Add(Entry entry) { Registry()->push_back(std::move(entry)); }

std::unique_ptr<Sandbox> Sandbox::Create() {
  const Entry* best = nullptr;
  int best_score = -1;
  for (const Entry& entry : *Registry()) {
    int score = entry.score();
    VLOG(1) << "Sandbox " << entry.name << " has score " << score;
    if (score > best_score) {
      best_score = score;
      best = &entry;
    }
  }
  if (best == nullptr || best_score < 0) {
    LOG(ERROR) << "No usable sandbox";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>(best->create());
}

std::unique_ptr<Sandbox> Sandbox::Create(const std::string& name) {
  for (const Entry& entry : *Registry()) {
    if (entry.name == name) return std::unique_ptr<Sandbox>(entry.create());
  }
  LOG(ERROR) << "No sandbox named " << name;
  return nullptr;
}

}  // namespace sandbox
