#include <cppunit/TextTestRunner.h>
#include <cppunit/extensions/TestFactoryRegistry.h>

#include <clocale>

int main(int argc, char *argv[])
{
	std::setlocale(LC_ALL, "");

	CppUnit::TestFactoryRegistry &registry = CppUnit::TestFactoryRegistry::getRegistry();

	CppUnit::TextTestRunner runner;
	runner.addTest(registry.makeTest());

	// Run a single test, or a single suite, if named on the command line.
	std::string test_path;
	if (argc > 1)
		test_path = argv[1];

	bool success = runner.run(test_path, false);

	return success ? 0 : 1;
}
