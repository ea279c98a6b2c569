#pragma once

// Режим генерации выражений: пишет случайные выражения в папку tests
void runGenerateMode();
