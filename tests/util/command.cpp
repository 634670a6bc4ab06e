#include "procsup/util/command.hpp"

#include <cassert>
#include <iostream>

int main()
{
    using procsup::util::shell_quote;
    using procsup::util::str_command;

    assert(shell_quote("plain-arg_1.txt") == "plain-arg_1.txt");
    assert(shell_quote("") == "''");
    assert(shell_quote("two words") == "'two words'");
    assert(shell_quote("it's") == "'it'\"'\"'s'");
    assert(str_command({"kubectl", "get", "pods", "-l", "app=web server"}) ==
           "kubectl get pods -l 'app=web server'");
    assert(str_command({}).empty());

    std::cout << "[OK] command formatting tests passed\n";
    return 0;
}
