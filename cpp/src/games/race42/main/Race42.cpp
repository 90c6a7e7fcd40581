#include "arena/Main.hpp"
#include "games/race42/AgentFactory.hpp"

int main(int ac, char* av[]) { return arena::Main<race42::AgentFactory>::main(ac, av); }
