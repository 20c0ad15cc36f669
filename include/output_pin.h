#pragma once

// One physical output line. Implementations must tolerate calls from
// several tasks at once.
class OutputPin {
public:
    virtual ~OutputPin() {}

    virtual bool configureAsOutput() = 0;
    virtual void setHigh() = 0;
    virtual void setLow() = 0;
};
