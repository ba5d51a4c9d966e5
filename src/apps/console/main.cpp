#include "appConfig.hpp"
#include "consoleSession.hpp"

#include <iostream>

int main(int, char**) {
	turnkit::console::ConsoleSession session(std::cin, std::cout, turnkit::console::appConfig());
	return session.run();
}
