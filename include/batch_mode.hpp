#pragma once

// Интерактивный режим пакетного разбора: файл выражений -> CSV отчёт.
// Возвращает код завершения программы.
int runBatchMode();
