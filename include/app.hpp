/* PURPOSE:
 * Application entry: parse options, load settings, wire the components and run the loop.
*/

#pragma once

class App {
public:
    static int run(int argc, char** argv);
};
