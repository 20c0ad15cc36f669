#include "board.h"

void handleSerialCommands(ServiceConsole& console) {
    if (Serial.available() > 0) {
        String input = Serial.readStringUntil('\n');
        input.trim();
        if (input.length() == 0) return;

        Serial.print("USER COMMAND: ");
        Serial.println(input);
        console.handleLine(std::string(input.c_str(), input.length()));
    }
}
