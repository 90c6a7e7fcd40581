#include "arena/Main.hpp"
#include "games/nim/AgentFactory.hpp"

int main(int ac, char* av[]) { return arena::Main<nim::AgentFactory>::main(ac, av); }
