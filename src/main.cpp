/*

main.cpp
--------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <iostream>
#include <mailsend/cli.hpp>


int main(int argc, char* argv[])
{
    return mailsend::cli::run_cli(argc, argv, std::cout, std::cerr);
}
